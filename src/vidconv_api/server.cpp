#include "vidconv_api/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace vidconv_api {

crow::LogLevel parse_log_level(const std::string &level) {
  if (level == "debug") return crow::LogLevel::Debug;
  if (level == "warning") return crow::LogLevel::Warning;
  if (level == "error") return crow::LogLevel::Error;
  if (level == "critical") return crow::LogLevel::Critical;
  return crow::LogLevel::Info;
}

Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

void Server::set_log_level(const std::string &level) {
  app_.loglevel(parse_log_level(level));
}

void Server::start() {
  if (running_) {
    return;
  }
  // Crow binds numeric addresses only.
  std::string bind_address = host_;
  boost::system::error_code ec;
  boost::asio::ip::make_address(bind_address, ec);
  if (ec) {
    bind_address = host_ == "localhost" ? "127.0.0.1" : "0.0.0.0";
  }

  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this, bind_address] {
    app_.port(port_).bindaddr(bind_address).multithreaded().run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace vidconv_api
