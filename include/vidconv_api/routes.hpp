#pragma once
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <unordered_map>

#include "crow_connection.hpp"
#include "server.hpp"
#include "vidconv_core/session/connection.hpp"

// Forward declarations
namespace vidconv_core {
class ConnectionManager;
}  // namespace vidconv_core

namespace vidconv_api {

inline constexpr const char *kServerVersion = "1.0.0";

class Routes {
 public:
  explicit Routes(vidconv_core::ConnectionManager &connection_manager);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register the websocket endpoint and the health check with the server
  void register_routes(Server &server);

  // Sends a close frame to every client still connected.
  void close_connections(const std::string &reason);

 private:
  struct Binding {
    vidconv_core::ConnectionId id = 0;
    std::shared_ptr<CrowConnection> connection;
  };

  vidconv_core::ConnectionManager &connection_manager_;

  std::mutex bindings_mutex_;
  std::unordered_map<const crow::websocket::connection *, Binding> bindings_;

  // Websocket handlers
  void handle_open(crow::websocket::connection &conn);
  void handle_message(crow::websocket::connection &conn, const std::string &data, bool is_binary);
  void handle_close(crow::websocket::connection &conn, const std::string &reason, uint16_t code);

  // HTTP handlers
  crow::response handle_health_check(const crow::request &req);

  // Helper methods
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace vidconv_api
