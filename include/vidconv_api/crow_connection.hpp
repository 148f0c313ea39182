#pragma once
#include <crow.h>

#include <mutex>
#include <string>

#include "vidconv_core/session/connection.hpp"

namespace vidconv_api {

// Adapts a Crow websocket connection to the core Connection interface.
// Crow destroys the underlying connection after onclose, so the route must call
// mark_closed() from there; later sends are dropped.
class CrowConnection : public vidconv_core::Connection {
 public:
  explicit CrowConnection(crow::websocket::connection &connection);

  CrowConnection(const CrowConnection &) = delete;
  CrowConnection &operator=(const CrowConnection &) = delete;

  void send_text(const std::string &message) override;

  bool is_open() const override;

  std::string remote_address() const override {
    return remote_address_;
  }

  void mark_closed();

  // Sends a close frame; the connection stays usable until Crow reports onclose.
  void close(const std::string &reason);

 private:
  mutable std::mutex mutex_;
  crow::websocket::connection *connection_;
  std::string remote_address_;
};

}  // namespace vidconv_api
