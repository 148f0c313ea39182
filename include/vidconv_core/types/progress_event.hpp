#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "vidconv_core/errors.hpp"

namespace vidconv_core {

enum class ProgressStatus { PROGRESS, COMPLETED, ERROR };

inline std::string to_string(ProgressStatus status) {
  switch (status) {
    case ProgressStatus::PROGRESS: return "progress";
    case ProgressStatus::COMPLETED: return "completed";
    case ProgressStatus::ERROR: return "error";
  }
  return "unknown";
}

struct ProgressEvent {
  ProgressStatus status = ProgressStatus::PROGRESS;
  std::optional<int> progress;
  std::optional<double> time;
  std::optional<double> duration;
  std::optional<std::string> output;
  std::optional<std::string> message;
  std::optional<ErrorKind> error_kind;

  bool is_terminal() const {
    return status != ProgressStatus::PROGRESS;
  }

  static ProgressEvent progress_update(int percent, double time_sec, double duration_sec) {
    ProgressEvent event;
    event.status = ProgressStatus::PROGRESS;
    event.progress = percent;
    event.time = time_sec;
    event.duration = duration_sec;
    return event;
  }

  static ProgressEvent completed(const std::string& output_path) {
    ProgressEvent event;
    event.status = ProgressStatus::COMPLETED;
    event.output = output_path;
    return event;
  }

  static ProgressEvent error(ErrorKind kind, const std::string& message) {
    ProgressEvent event;
    event.status = ProgressStatus::ERROR;
    event.message = message;
    event.error_kind = kind;
    return event;
  }
};

// Only the fields that are set are written out.
inline nlohmann::json to_json(const ProgressEvent& event) {
  nlohmann::json j;
  j["status"] = to_string(event.status);
  if (event.progress) {
    j["progress"] = *event.progress;
  }
  if (event.time) {
    j["time"] = *event.time;
  }
  if (event.duration) {
    j["duration"] = *event.duration;
  }
  if (event.output) {
    j["output"] = *event.output;
  }
  if (event.message) {
    j["message"] = *event.message;
  }
  if (event.error_kind) {
    j["code"] = kind_to_string(*event.error_kind);
  }
  return j;
}

}  // namespace vidconv_core
