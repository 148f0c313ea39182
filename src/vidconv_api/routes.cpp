#include "vidconv_api/routes.hpp"

#include <iostream>
#include <vector>

#include "vidconv_core/session/connection_manager.hpp"

namespace vidconv_api {
Routes::Routes(vidconv_core::ConnectionManager &connection_manager)
    : connection_manager_(connection_manager) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Conversion and upload channel
  CROW_WEBSOCKET_ROUTE(app, "/")
      .onopen([this](crow::websocket::connection &conn) { handle_open(conn); })
      .onclose([this](crow::websocket::connection &conn, const std::string &reason,
                      uint16_t code) { handle_close(conn, reason, code); })
      .onmessage([this](crow::websocket::connection &conn, const std::string &data,
                        bool is_binary) { handle_message(conn, data, is_binary); });

  // Health check endpoint
  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

void Routes::handle_open(crow::websocket::connection &conn) {
  auto connection = std::make_shared<CrowConnection>(conn);
  try {
    vidconv_core::ConnectionId id = connection_manager_.open(connection);
    std::lock_guard<std::mutex> lock(bindings_mutex_);
    bindings_[&conn] = Binding{id, connection};
  } catch (const std::exception &e) {
    std::cerr << "Failed to register connection from " << connection->remote_address() << ": "
              << e.what() << std::endl;
    connection->close("Server error");
  }
}

void Routes::handle_message(crow::websocket::connection &conn, const std::string &data,
                            bool is_binary) {
  vidconv_core::ConnectionId id = 0;
  {
    std::lock_guard<std::mutex> lock(bindings_mutex_);
    auto it = bindings_.find(&conn);
    if (it == bindings_.end()) {
      return;
    }
    id = it->second.id;
  }
  if (is_binary) {
    std::cerr << "Connection " << id << " sent a binary frame, treating it as text" << std::endl;
  }
  connection_manager_.handle_message(id, data);
}

void Routes::handle_close(crow::websocket::connection &conn, const std::string &reason,
                          uint16_t code) {
  Binding binding;
  {
    std::lock_guard<std::mutex> lock(bindings_mutex_);
    auto it = bindings_.find(&conn);
    if (it == bindings_.end()) {
      return;
    }
    binding = std::move(it->second);
    bindings_.erase(it);
  }

  // Crow frees the connection once this handler returns.
  binding.connection->mark_closed();
  std::cout << "Connection " << binding.id << " closed by peer (code " << code
            << (reason.empty() ? "" : ", " + reason) << ")" << std::endl;
  connection_manager_.close(binding.id);
}

void Routes::close_connections(const std::string &reason) {
  std::vector<std::shared_ptr<CrowConnection>> connections;
  {
    std::lock_guard<std::mutex> lock(bindings_mutex_);
    for (const auto &[conn, binding] : bindings_) {
      connections.push_back(binding.connection);
    }
  }
  for (const auto &connection : connections) {
    connection->close(reason);
  }
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response;
  response["status"] = "healthy";
  response["version"] = kServerVersion;
  response["connections"] = connection_manager_.connection_count();
  return create_json_response(response);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

}  // namespace vidconv_api
