#pragma once

#include <memory>
#include <string>
#include <vector>

namespace vidconv_core {

class ProcessError : public std::exception {
 public:
  explicit ProcessError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ProcessOutput {
  int exit_code = -1;
  std::string std_out;
};

/**
 * @class ChildProcess
 * @brief A running external process whose stdout is consumed line by line.
 *
 * stderr is drained in the background and made available once the process
 * has been waited for. terminate() may be called from any thread, including
 * while another thread is blocked in read_line().
 */
class ChildProcess {
 public:
  virtual ~ChildProcess() = default;

  // Returns false once stdout reached end of stream.
  virtual bool read_line(std::string &line) = 0;

  // Blocks until the process exited and returns its exit code.
  virtual int wait() = 0;

  virtual void terminate() = 0;

  virtual std::string error_output() const = 0;
};

class ProcessLauncher {
 public:
  ProcessLauncher() = default;
  virtual ~ProcessLauncher() = default;

  ProcessLauncher(const ProcessLauncher &) = delete;
  ProcessLauncher &operator=(const ProcessLauncher &) = delete;

  // Runs a short-lived command to completion and captures its stdout.
  // stderr is discarded. Throws ProcessError if the program cannot be started.
  virtual ProcessOutput run(const std::string &program, const std::vector<std::string> &args);

  // Starts a long-running command. Throws ProcessError if it cannot be started.
  virtual std::unique_ptr<ChildProcess> spawn(const std::string &program,
                                              const std::vector<std::string> &args);

  // Bare names are looked up on PATH, anything with a separator is used as is.
  static std::string resolve_executable(const std::string &program);
};

}  // namespace vidconv_core
