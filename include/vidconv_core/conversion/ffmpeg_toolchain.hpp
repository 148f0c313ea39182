#pragma once

#include <string>
#include <vector>

#include "vidconv_core/types/conversion_request.hpp"

namespace vidconv_core {

class ProcessLauncher;

struct ToolchainPaths {
  std::string ffmpeg = "ffmpeg";
  std::string ffprobe = "ffprobe";
};

/**
 * @class FfmpegToolchain
 * @brief Knows how to talk to the ffmpeg and ffprobe executables.
 *
 * All process creation goes through the ProcessLauncher so the toolchain can
 * be exercised against a mocked launcher.
 */
class FfmpegToolchain {
 public:
  static constexpr const char* kVersionMarker = "ffmpeg version";

  FfmpegToolchain(ProcessLauncher& launcher, ToolchainPaths paths = {});

  // True iff `ffmpeg -version` exits with 0 and prints the version marker.
  bool is_available() const;

  static std::string availability_message(bool available);

  // Media duration in seconds as reported by ffprobe, 0.0 when unknown.
  double probe_duration(const std::string& input_file) const;

  // Argument list for the conversion, without the program name.
  static std::vector<std::string> build_arguments(const ConversionRequest& request);

  const ToolchainPaths& paths() const {
    return paths_;
  }

  ProcessLauncher& launcher() const {
    return launcher_;
  }

 private:
  ProcessLauncher& launcher_;
  ToolchainPaths paths_;
};

}  // namespace vidconv_core
