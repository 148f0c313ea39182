#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace vidconv_api {

// Maps a configured level name (debug, info, warning, error, critical) to
// Crow's logger level. Unknown names map to Info.
crow::LogLevel parse_log_level(const std::string &level);

class Server {
 public:
  Server(const std::string &host, int port);
  ~Server() = default;

  // Disable move and copy operations since crow::SimpleApp doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void set_log_level(const std::string &level);

  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;  // Manages the server thread
  bool running_ = false;
};
}  // namespace vidconv_api
