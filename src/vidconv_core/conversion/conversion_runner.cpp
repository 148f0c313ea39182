#include "vidconv_core/conversion/conversion_runner.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>

#include "vidconv_core/async/cancellation_token.hpp"
#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"
#include "vidconv_core/process/process_launcher.hpp"

namespace vidconv_core {

namespace {

constexpr const char* kTimeMarker = "out_time_ms=";

// Kills the child on cancellation for as long as it is alive.
class TerminateOnCancel {
 public:
  TerminateOnCancel(async::CancellationToken& token, ChildProcess& child) : token_(token) {
    token_.on_cancel([&child] { child.terminate(); });
  }
  ~TerminateOnCancel() {
    token_.clear_handler();
  }

  TerminateOnCancel(const TerminateOnCancel&) = delete;
  TerminateOnCancel& operator=(const TerminateOnCancel&) = delete;

 private:
  async::CancellationToken& token_;
};

}  // namespace

ConversionRunner::ConversionRunner(FfmpegToolchain& toolchain) : toolchain_(toolchain) {}

std::optional<double> ConversionRunner::parse_progress_line(const std::string& line) {
  const std::string marker = kTimeMarker;
  if (line.compare(0, marker.size(), marker) != 0) {
    return std::nullopt;
  }
  const std::string value = line.substr(marker.size());
  try {
    size_t consumed = 0;
    long long microseconds = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return static_cast<double>(microseconds) / 1000000.0;
  } catch (const std::exception&) {
    // ffmpeg prints out_time_ms=N/A before the first frame.
    return std::nullopt;
  }
}

int ConversionRunner::compute_percentage(double elapsed_sec, double duration_sec) {
  if (duration_sec <= 0.0 || elapsed_sec <= 0.0) {
    return 0;
  }
  double percent = std::floor(elapsed_sec / duration_sec * 100.0);
  return static_cast<int>(std::min(100.0, percent));
}

bool ConversionRunner::validate_and_prepare(const ConversionRequest& request, ProgressSink& sink) {
  if (request.input_file.empty()) {
    sink.emit(ProgressEvent::error(ErrorKind::InvalidInput, "Input file path is required"));
    return false;
  }
  if (request.output_file.empty()) {
    sink.emit(ProgressEvent::error(ErrorKind::InvalidInput, "Output file path is required"));
    return false;
  }

  if (!toolchain_.is_available()) {
    sink.emit(ProgressEvent::error(
        ErrorKind::ToolingUnavailable,
        "FFmpeg not found. Please install FFmpeg and add it to system PATH"));
    return false;
  }

  std::error_code ec;
  const std::filesystem::path input(request.input_file);
  if (!std::filesystem::exists(input, ec)) {
    sink.emit(ProgressEvent::error(ErrorKind::InvalidInput,
                                   "Input file not found: " + request.input_file));
    return false;
  }
  if (!std::filesystem::is_regular_file(input, ec)) {
    sink.emit(ProgressEvent::error(ErrorKind::InvalidInput,
                                   "Input path is not a file: " + request.input_file));
    return false;
  }

  const std::filesystem::path output_dir = std::filesystem::path(request.output_file).parent_path();
  if (!output_dir.empty() && !std::filesystem::exists(output_dir, ec)) {
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
      sink.emit(ProgressEvent::error(ErrorKind::IOFailure,
                                     "Failed to create output directory: " + ec.message()));
      return false;
    }
  }
  return true;
}

bool ConversionRunner::run(const ConversionRequest& request,
                           ProgressSink& sink,
                           async::CancellationToken& cancellation) {
  if (cancellation.is_cancelled()) {
    return false;
  }
  if (!validate_and_prepare(request, sink)) {
    return false;
  }

  const double duration = toolchain_.probe_duration(request.input_file);
  if (cancellation.is_cancelled()) {
    return false;
  }

  std::unique_ptr<ChildProcess> child;
  try {
    child = toolchain_.launcher().spawn(toolchain_.paths().ffmpeg,
                                        FfmpegToolchain::build_arguments(request));
  } catch (const std::exception& e) {
    sink.emit(ProgressEvent::error(ErrorKind::ProcessFailure, e.what()));
    return false;
  }

  std::cout << "[ConversionRunner] converting '" << request.input_file << "' -> '"
            << request.output_file << "' (duration " << duration << "s)" << std::endl;

  try {
    TerminateOnCancel terminate_guard(cancellation, *child);

    int last_percent = 0;
    std::string line;
    while (child->read_line(line)) {
      if (cancellation.is_cancelled()) {
        break;
      }
      std::optional<double> elapsed = ConversionRunner::parse_progress_line(line);
      if (!elapsed) {
        continue;
      }
      const double time_sec = std::max(0.0, *elapsed);
      last_percent = std::max(last_percent, compute_percentage(time_sec, duration));
      sink.emit(ProgressEvent::progress_update(last_percent, time_sec, duration));
    }

    const int exit_code = child->wait();
    if (cancellation.is_cancelled()) {
      std::cout << "[ConversionRunner] conversion of '" << request.input_file << "' cancelled"
                << std::endl;
      return false;
    }

    if (exit_code == 0) {
      sink.emit(ProgressEvent::completed(request.output_file));
      return true;
    }

    std::string diagnostics = child->error_output();
    if (diagnostics.empty()) {
      diagnostics = "FFmpeg exited with code " + std::to_string(exit_code);
    }
    sink.emit(ProgressEvent::error(ErrorKind::ProcessFailure, diagnostics));
    return false;
  } catch (const std::exception& e) {
    std::cerr << "[ConversionRunner] conversion of '" << request.input_file
              << "' failed: " << e.what() << std::endl;
    if (!cancellation.is_cancelled()) {
      sink.emit(ProgressEvent::error(ErrorKind::ProcessFailure, e.what()));
    }
    return false;
  }
}

}  // namespace vidconv_core
