#pragma once

#include <optional>
#include <string>

#include "vidconv_core/types/conversion_request.hpp"
#include "vidconv_core/types/progress_event.hpp"

namespace vidconv_core {

class FfmpegToolchain;

namespace async {
class CancellationToken;
}

// Receives the events of one conversion, in the order they are produced.
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;
  virtual void emit(const ProgressEvent& event) = 0;
};

/**
 * @class ConversionRunner
 * @brief Runs one ffmpeg conversion and reports it as ProgressEvents.
 *
 * run() is blocking and is meant to be called from a worker thread. Every run
 * that is not cancelled ends with exactly one terminal event (completed or
 * error). A cancelled run emits nothing after the cancellation was observed.
 */
class ConversionRunner {
 public:
  explicit ConversionRunner(FfmpegToolchain& toolchain);
  virtual ~ConversionRunner() = default;

  ConversionRunner(const ConversionRunner&) = delete;
  ConversionRunner& operator=(const ConversionRunner&) = delete;

  virtual bool run(const ConversionRequest& request,
                   ProgressSink& sink,
                   async::CancellationToken& cancellation);

  // Elapsed seconds carried by an `out_time_ms=<microseconds>` line.
  static std::optional<double> parse_progress_line(const std::string& line);

  // min(100, floor(elapsed / duration * 100)), 0 when the duration is unknown.
  static int compute_percentage(double elapsed_sec, double duration_sec);

 private:
  bool validate_and_prepare(const ConversionRequest& request, ProgressSink& sink);

  FfmpegToolchain& toolchain_;
};

}  // namespace vidconv_core
