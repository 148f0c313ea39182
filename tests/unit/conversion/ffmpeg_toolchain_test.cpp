#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>

#include "mocks_test.hpp"
#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"

namespace vidconv_tests {

using namespace vidconv_core;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class FfmpegToolchainTest : public ::testing::Test {
 protected:
  StrictMock<MockProcessLauncher> launcher_;
  FfmpegToolchain toolchain_{launcher_};
};

TEST_F(FfmpegToolchainTest, AvailableWhenVersionProbeSucceeds) {
  EXPECT_CALL(launcher_, run("ffmpeg", ElementsAre("-version")))
      .WillOnce(Return(MockUtilities::ffmpeg_version_output()));
  EXPECT_TRUE(toolchain_.is_available());
}

TEST_F(FfmpegToolchainTest, UnavailableOnNonZeroExit) {
  ProcessOutput output = MockUtilities::ffmpeg_version_output();
  output.exit_code = 1;
  EXPECT_CALL(launcher_, run("ffmpeg", _)).WillOnce(Return(output));
  EXPECT_FALSE(toolchain_.is_available());
}

TEST_F(FfmpegToolchainTest, UnavailableWithoutVersionMarker) {
  ProcessOutput output;
  output.exit_code = 0;
  output.std_out = "some other program\n";
  EXPECT_CALL(launcher_, run("ffmpeg", _)).WillOnce(Return(output));
  EXPECT_FALSE(toolchain_.is_available());
}

TEST_F(FfmpegToolchainTest, UnavailableWhenProgramMissing) {
  EXPECT_CALL(launcher_, run("ffmpeg", _))
      .WillOnce(Throw(ProcessError("Executable not found on PATH: ffmpeg")));
  EXPECT_FALSE(toolchain_.is_available());
}

TEST_F(FfmpegToolchainTest, UsesConfiguredExecutables) {
  StrictMock<MockProcessLauncher> launcher;
  FfmpegToolchain toolchain(launcher, ToolchainPaths{"/opt/ff/ffmpeg", "/opt/ff/ffprobe"});
  EXPECT_CALL(launcher, run("/opt/ff/ffmpeg", _))
      .WillOnce(Return(MockUtilities::ffmpeg_version_output()));
  EXPECT_CALL(launcher, run("/opt/ff/ffprobe", _))
      .WillOnce(Return(MockUtilities::ffprobe_output("3.5")));

  EXPECT_TRUE(toolchain.is_available());
  EXPECT_DOUBLE_EQ(toolchain.probe_duration("clip.mov"), 3.5);
}

TEST_F(FfmpegToolchainTest, ProbeDurationParsesStringAndNumber) {
  EXPECT_CALL(launcher_, run("ffprobe", ElementsAre("-v", "quiet", "-print_format", "json",
                                                    "-show_format", "sample.mov")))
      .WillOnce(Return(MockUtilities::ffprobe_output("12.480000")))
      .WillOnce(Return(MockUtilities::ffprobe_output(7.25)));

  EXPECT_DOUBLE_EQ(toolchain_.probe_duration("sample.mov"), 12.48);
  EXPECT_DOUBLE_EQ(toolchain_.probe_duration("sample.mov"), 7.25);
}

TEST_F(FfmpegToolchainTest, ProbeDurationFallsBackToZero) {
  ProcessOutput garbage;
  garbage.exit_code = 0;
  garbage.std_out = "not json";
  ProcessOutput no_duration;
  no_duration.exit_code = 0;
  no_duration.std_out = R"({"format": {}})";

  EXPECT_CALL(launcher_, run("ffprobe", _))
      .WillOnce(Return(MockUtilities::failed_output()))
      .WillOnce(Return(garbage))
      .WillOnce(Return(no_duration))
      .WillOnce(Throw(ProcessError("Executable not found on PATH: ffprobe")));

  for (int i = 0; i < 4; ++i) {
    EXPECT_DOUBLE_EQ(toolchain_.probe_duration("sample.mov"), 0.0);
  }
}

TEST_F(FfmpegToolchainTest, BuildsArgumentsWithDefaults) {
  ConversionRequest request;
  request.input_file = "sample.mov";
  request.output_file = "sample.mp4";

  std::vector<std::string> expected = {"-i",   "sample.mov", "-c:v",      "libx264",
                                       "-preset", "medium", "-crf",     "23",
                                       "-c:a", "aac",        "-b:a",      "128k",
                                       "-y",   "-progress",  "pipe:1",    "-hide_banner",
                                       "-loglevel", "error", "sample.mp4"};
  EXPECT_EQ(FfmpegToolchain::build_arguments(request), expected);
}

TEST_F(FfmpegToolchainTest, ScaleFilterPrecedesOverwriteFlag) {
  ConversionRequest request;
  request.input_file = "in.avi";
  request.output_file = "out.mp4";
  request.options.resolution = "1280x720";

  std::vector<std::string> args = FfmpegToolchain::build_arguments(request);
  auto vf = std::find(args.begin(), args.end(), "-vf");
  auto bitrate = std::find(args.begin(), args.end(), "-b:a");
  auto overwrite = std::find(args.begin(), args.end(), "-y");
  ASSERT_NE(vf, args.end());
  EXPECT_EQ(*(vf + 1), "scale=1280x720");
  EXPECT_LT(bitrate, vf);
  EXPECT_LT(vf, overwrite);
  EXPECT_EQ(args.back(), "out.mp4");
}

TEST_F(FfmpegToolchainTest, AvailabilityMessages) {
  EXPECT_EQ(FfmpegToolchain::availability_message(true), "FFmpeg is available");
  EXPECT_EQ(FfmpegToolchain::availability_message(false), "FFmpeg is not installed or not in PATH");
}

}  // namespace vidconv_tests
