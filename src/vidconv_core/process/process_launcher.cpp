#include "vidconv_core/process/process_launcher.hpp"

#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <csignal>
#include <iostream>
#include <mutex>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace vidconv_core {

namespace {

class BoostChildProcess : public ChildProcess {
 public:
  BoostChildProcess(const std::string &exe, const std::vector<std::string> &args)
      : child_(bp::exe = exe, bp::args = args, bp::std_out > out_, bp::std_err > err_,
               bp::std_in < bp::null) {
    pid_ = child_.id();
    stderr_thread_ = std::thread([this] {
      std::string line;
      while (std::getline(err_, line)) {
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_text_ += line;
        stderr_text_ += '\n';
      }
    });
  }

  ~BoostChildProcess() override {
    if (!reaped_) {
      terminate();
      wait();
    }
    if (stderr_thread_.joinable()) {
      stderr_thread_.join();
    }
  }

  BoostChildProcess(const BoostChildProcess &) = delete;
  BoostChildProcess &operator=(const BoostChildProcess &) = delete;

  bool read_line(std::string &line) override {
    if (!std::getline(out_, line)) {
      return false;
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return true;
  }

  int wait() override {
    // Wait without reaping first so terminate() never signals a recycled pid.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1 &&
           errno == EINTR) {
    }

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (!reaped_) {
        std::error_code ec;
        child_.wait(ec);
        if (ec) {
          std::cerr << "[ProcessLauncher] wait failed for pid " << pid_ << ": " << ec.message()
                    << std::endl;
        }
        reaped_ = true;
      }
    }

    if (stderr_thread_.joinable()) {
      stderr_thread_.join();
    }
    return child_.exit_code();
  }

  void terminate() override {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) {
      return;
    }
    if (::kill(static_cast<pid_t>(pid_), SIGKILL) != 0 && errno != ESRCH) {
      std::cerr << "[ProcessLauncher] failed to kill pid " << pid_ << std::endl;
    }
  }

  std::string error_output() const override {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_text_;
  }

 private:
  bp::ipstream out_;
  bp::ipstream err_;
  bp::child child_;
  bp::pid_t pid_ = 0;

  std::thread stderr_thread_;
  mutable std::mutex stderr_mutex_;
  std::string stderr_text_;

  std::mutex state_mutex_;
  bool reaped_ = false;
};

}  // namespace

std::string ProcessLauncher::resolve_executable(const std::string &program) {
  if (program.empty()) {
    throw ProcessError("No executable given");
  }
  if (program.find('/') != std::string::npos) {
    if (!boost::filesystem::exists(program)) {
      throw ProcessError("Executable not found: " + program);
    }
    return program;
  }
  boost::filesystem::path found = bp::search_path(program);
  if (found.empty()) {
    throw ProcessError("Executable not found on PATH: " + program);
  }
  return found.string();
}

ProcessOutput ProcessLauncher::run(const std::string &program,
                                   const std::vector<std::string> &args) {
  const std::string exe = resolve_executable(program);
  ProcessOutput output;
  try {
    bp::ipstream out;
    bp::child child(bp::exe = exe, bp::args = args, bp::std_out > out, bp::std_err > bp::null,
                    bp::std_in < bp::null);

    std::string line;
    while (std::getline(out, line)) {
      output.std_out += line;
      output.std_out += '\n';
    }
    child.wait();
    output.exit_code = child.exit_code();
  } catch (const bp::process_error &e) {
    throw ProcessError("Failed to run " + program + ": " + e.what());
  }
  return output;
}

std::unique_ptr<ChildProcess> ProcessLauncher::spawn(const std::string &program,
                                                     const std::vector<std::string> &args) {
  const std::string exe = resolve_executable(program);
  try {
    return std::make_unique<BoostChildProcess>(exe, args);
  } catch (const bp::process_error &e) {
    throw ProcessError("Failed to start " + program + ": " + e.what());
  }
}

}  // namespace vidconv_core
