#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "vidconv_core/process/process_launcher.hpp"

namespace vidconv_core {

FfmpegToolchain::FfmpegToolchain(ProcessLauncher& launcher, ToolchainPaths paths)
    : launcher_(launcher), paths_(std::move(paths)) {}

bool FfmpegToolchain::is_available() const {
  try {
    ProcessOutput output = launcher_.run(paths_.ffmpeg, {"-version"});
    return output.exit_code == 0 && output.std_out.find(kVersionMarker) != std::string::npos;
  } catch (const std::exception& e) {
    std::cerr << "[FfmpegToolchain] version probe failed: " << e.what() << std::endl;
    return false;
  }
}

std::string FfmpegToolchain::availability_message(bool available) {
  return available ? "FFmpeg is available" : "FFmpeg is not installed or not in PATH";
}

double FfmpegToolchain::probe_duration(const std::string& input_file) const {
  try {
    ProcessOutput output = launcher_.run(
        paths_.ffprobe, {"-v", "quiet", "-print_format", "json", "-show_format", input_file});
    if (output.exit_code != 0) {
      return 0.0;
    }

    nlohmann::json info = nlohmann::json::parse(output.std_out);
    const nlohmann::json& duration = info.at("format").at("duration");
    double seconds = duration.is_string() ? std::stod(duration.get<std::string>())
                                          : duration.get<double>();
    return seconds > 0.0 ? seconds : 0.0;
  } catch (const std::exception& e) {
    std::cerr << "[FfmpegToolchain] duration probe failed for " << input_file << ": " << e.what()
              << std::endl;
    return 0.0;
  }
}

std::vector<std::string> FfmpegToolchain::build_arguments(const ConversionRequest& request) {
  const ConversionOptions& options = request.options;
  std::vector<std::string> args = {
      "-i",    request.input_file,
      "-c:v",  options.codec,
      "-preset", options.preset,
      "-crf",  options.crf,
      "-c:a",  options.audio_codec,
      "-b:a",  options.audio_bitrate,
  };

  if (options.resolution) {
    args.push_back("-vf");
    args.push_back("scale=" + *options.resolution);
  }

  args.insert(args.end(), {"-y", "-progress", "pipe:1", "-hide_banner", "-loglevel", "error"});
  args.push_back(request.output_file);
  return args;
}

}  // namespace vidconv_core
