#pragma once

#include <exception>
#include <string>

namespace vidconv_core {

enum class ErrorKind {
  ToolingUnavailable,
  InvalidInput,
  IOFailure,
  ProcessFailure,
  NotFound,
  ProtocolError,
  Cancelled
};

inline std::string kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ToolingUnavailable: return "tooling_unavailable";
    case ErrorKind::InvalidInput: return "invalid_input";
    case ErrorKind::IOFailure: return "io_failure";
    case ErrorKind::ProcessFailure: return "process_failure";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::ProtocolError: return "protocol_error";
    case ErrorKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

class VidconvError : public std::exception {
 public:
  VidconvError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

}  // namespace vidconv_core
