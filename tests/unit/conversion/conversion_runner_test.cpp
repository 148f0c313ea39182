#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <thread>

#include "mocks_test.hpp"
#include "utilities_test.hpp"
#include "vidconv_core/async/cancellation_token.hpp"
#include "vidconv_core/conversion/conversion_runner.hpp"
#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"

namespace vidconv_tests {

using namespace vidconv_core;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class ConversionRunnerTest : public TempDirectoryTestBase {
 protected:
  void SetUp() override {
    TempDirectoryTestBase::SetUp();
    input_ = temp_dir_ / "sample.mov";
    TestUtilities::write_file(input_, "fake movie data");
    request_.input_file = input_.string();
    request_.output_file = (temp_dir_ / "sample.mp4").string();
  }

  void expect_ffmpeg_available() {
    EXPECT_CALL(launcher_, run("ffmpeg", ElementsAre("-version")))
        .WillRepeatedly(Return(MockUtilities::ffmpeg_version_output()));
  }

  void expect_duration(double seconds) {
    EXPECT_CALL(launcher_, run("ffprobe", _))
        .WillOnce(Return(MockUtilities::ffprobe_output(seconds)));
  }

  void expect_spawn(FakeChildProcess::Script script,
                    std::shared_ptr<FakeChildState> state = std::make_shared<FakeChildState>()) {
    EXPECT_CALL(launcher_, spawn("ffmpeg", FfmpegToolchain::build_arguments(request_)))
        .WillOnce([script, state](const std::string&, const std::vector<std::string>&) {
          return MockUtilities::make_child(script, state);
        });
  }

  static std::vector<std::string> concat(std::vector<std::vector<std::string>> blocks) {
    std::vector<std::string> lines;
    for (auto& block : blocks) {
      lines.insert(lines.end(), block.begin(), block.end());
    }
    return lines;
  }

  StrictMock<MockProcessLauncher> launcher_;
  FfmpegToolchain toolchain_{launcher_};
  ConversionRunner runner_{toolchain_};
  RecordingSink sink_;
  async::CancellationToken token_;
  std::filesystem::path input_;
  ConversionRequest request_;
};

TEST_F(ConversionRunnerTest, ReportsProgressThenCompletion) {
  expect_ffmpeg_available();
  expect_duration(10.0);
  FakeChildProcess::Script script;
  script.lines = concat({MockUtilities::progress_block(2500000),
                         MockUtilities::progress_block(5000000),
                         MockUtilities::progress_block(10000000),
                         {"progress=end"}});
  expect_spawn(script);

  EXPECT_TRUE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].status, ProgressStatus::PROGRESS);
  EXPECT_EQ(*events[0].progress, 25);
  EXPECT_DOUBLE_EQ(*events[0].time, 2.5);
  EXPECT_DOUBLE_EQ(*events[0].duration, 10.0);
  EXPECT_EQ(*events[1].progress, 50);
  EXPECT_EQ(*events[2].progress, 100);
  EXPECT_EQ(events[3].status, ProgressStatus::COMPLETED);
  EXPECT_EQ(*events[3].output, request_.output_file);
}

TEST_F(ConversionRunnerTest, ProgressNeverDecreasesAndIsCapped) {
  expect_ffmpeg_available();
  expect_duration(10.0);
  FakeChildProcess::Script script;
  script.lines = {"out_time_ms=6000000", "out_time_ms=4000000", "out_time_ms=N/A",
                  "out_time_ms=-5", "out_time_ms=12000000"};
  expect_spawn(script);

  EXPECT_TRUE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 5u);
  EXPECT_EQ(*events[0].progress, 60);
  EXPECT_EQ(*events[1].progress, 60);
  EXPECT_EQ(*events[2].progress, 60);
  EXPECT_DOUBLE_EQ(*events[2].time, 0.0);
  EXPECT_EQ(*events[3].progress, 100);
  EXPECT_TRUE(events[4].is_terminal());
}

TEST_F(ConversionRunnerTest, UnknownDurationReportsZeroPercent) {
  expect_ffmpeg_available();
  EXPECT_CALL(launcher_, run("ffprobe", _)).WillOnce(Return(MockUtilities::failed_output()));
  FakeChildProcess::Script script;
  script.lines = {"out_time_ms=3000000"};
  expect_spawn(script);

  EXPECT_TRUE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(*events[0].progress, 0);
  EXPECT_EQ(events[1].status, ProgressStatus::COMPLETED);
}

TEST_F(ConversionRunnerTest, MissingInputFileFailsWithoutSpawning) {
  expect_ffmpeg_available();
  EXPECT_CALL(launcher_, spawn(_, _)).Times(0);
  request_.input_file = (temp_dir_ / "missing.mov").string();

  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].status, ProgressStatus::ERROR);
  EXPECT_EQ(*events[0].error_kind, ErrorKind::InvalidInput);
  EXPECT_EQ(*events[0].message, "Input file not found: " + request_.input_file);
}

TEST_F(ConversionRunnerTest, DirectoryAsInputIsRejected) {
  expect_ffmpeg_available();
  request_.input_file = temp_dir_.string();

  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(*events[0].error_kind, ErrorKind::InvalidInput);
}

TEST_F(ConversionRunnerTest, EmptyPathsAreRejectedBeforeProbingTools) {
  request_.input_file.clear();
  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  request_.input_file = input_.string();
  request_.output_file.clear();
  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(*events[0].message, "Input file path is required");
  EXPECT_EQ(*events[1].message, "Output file path is required");
}

TEST_F(ConversionRunnerTest, MissingFfmpegReportsToolingUnavailable) {
  EXPECT_CALL(launcher_, run("ffmpeg", _))
      .WillOnce(Throw(ProcessError("Executable not found on PATH: ffmpeg")));

  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(*events[0].error_kind, ErrorKind::ToolingUnavailable);
}

TEST_F(ConversionRunnerTest, CreatesMissingOutputDirectory) {
  expect_ffmpeg_available();
  request_.output_file = (temp_dir_ / "converted" / "nested" / "sample.mp4").string();
  expect_duration(1.0);
  expect_spawn(FakeChildProcess::Script{});

  EXPECT_TRUE(runner_.run(request_, sink_, token_));
  EXPECT_TRUE(std::filesystem::is_directory(temp_dir_ / "converted" / "nested"));
}

TEST_F(ConversionRunnerTest, UncreatableOutputDirectoryFailsWithoutSpawning) {
  expect_ffmpeg_available();
  EXPECT_CALL(launcher_, spawn(_, _)).Times(0);
  // A regular file where a directory is needed.
  TestUtilities::write_file(temp_dir_ / "blocker", "not a directory");
  request_.output_file = (temp_dir_ / "blocker" / "nested" / "sample.mp4").string();

  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].status, ProgressStatus::ERROR);
  EXPECT_EQ(*events[0].error_kind, ErrorKind::IOFailure);
  EXPECT_EQ(events[0].message->rfind("Failed to create output directory: ", 0), 0u);
  EXPECT_EQ(to_json(events[0])["code"], "io_failure");
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "blocker" / "nested"));
}

TEST_F(ConversionRunnerTest, NonZeroExitReportsStderr) {
  expect_ffmpeg_available();
  expect_duration(10.0);
  FakeChildProcess::Script script;
  script.exit_code = 1;
  script.error_output = "sample.mov: Invalid data found when processing input\n";
  expect_spawn(script);

  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(*events[0].error_kind, ErrorKind::ProcessFailure);
  EXPECT_EQ(*events[0].message, script.error_output);
}

TEST_F(ConversionRunnerTest, NonZeroExitWithoutStderrReportsExitCode) {
  expect_ffmpeg_available();
  expect_duration(10.0);
  FakeChildProcess::Script script;
  script.exit_code = 69;
  expect_spawn(script);

  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(*events[0].message, "FFmpeg exited with code 69");
}

TEST_F(ConversionRunnerTest, SpawnFailureReportsProcessFailure) {
  expect_ffmpeg_available();
  expect_duration(10.0);
  EXPECT_CALL(launcher_, spawn(_, _)).WillOnce(Throw(ProcessError("Failed to start ffmpeg")));

  EXPECT_FALSE(runner_.run(request_, sink_, token_));

  auto events = sink_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(*events[0].error_kind, ErrorKind::ProcessFailure);
  EXPECT_EQ(*events[0].message, "Failed to start ffmpeg");
}

TEST_F(ConversionRunnerTest, AlreadyCancelledTokenDoesNothing) {
  token_.cancel();
  EXPECT_FALSE(runner_.run(request_, sink_, token_));
  EXPECT_TRUE(sink_.events().empty());
}

TEST_F(ConversionRunnerTest, CancellationKillsChildAndSuppressesTerminalEvent) {
  expect_ffmpeg_available();
  expect_duration(10.0);
  auto state = std::make_shared<FakeChildState>();
  FakeChildProcess::Script script;
  script.lines = MockUtilities::progress_block(1000000);
  script.hold_open = true;
  expect_spawn(script, state);

  bool result = true;
  std::thread worker([&] { result = runner_.run(request_, sink_, token_); });
  ASSERT_TRUE(state->wait_until_reading(std::chrono::seconds(5)));
  token_.cancel();
  worker.join();

  EXPECT_FALSE(result);
  EXPECT_TRUE(state->was_terminated());
  for (const auto& event : sink_.events()) {
    EXPECT_FALSE(event.is_terminal());
  }
}

TEST(ConversionRunnerStaticTest, ParsesOutTimeLines) {
  EXPECT_DOUBLE_EQ(*ConversionRunner::parse_progress_line("out_time_ms=1500000"), 1.5);
  EXPECT_FALSE(ConversionRunner::parse_progress_line("out_time_ms=N/A").has_value());
  EXPECT_FALSE(ConversionRunner::parse_progress_line("out_time_ms=12abc").has_value());
  EXPECT_FALSE(ConversionRunner::parse_progress_line("out_time=00:00:01.5").has_value());
  EXPECT_FALSE(ConversionRunner::parse_progress_line("progress=end").has_value());
}

TEST(ConversionRunnerStaticTest, PercentageIsFlooredAndBounded) {
  EXPECT_EQ(ConversionRunner::compute_percentage(3.33, 10.0), 33);
  EXPECT_EQ(ConversionRunner::compute_percentage(9.999, 10.0), 99);
  EXPECT_EQ(ConversionRunner::compute_percentage(15.0, 10.0), 100);
  EXPECT_EQ(ConversionRunner::compute_percentage(5.0, 0.0), 0);
  EXPECT_EQ(ConversionRunner::compute_percentage(-1.0, 10.0), 0);
}

}  // namespace vidconv_tests
