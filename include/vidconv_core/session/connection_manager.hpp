#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "vidconv_core/errors.hpp"
#include "vidconv_core/session/connection.hpp"
#include "vidconv_core/session/upload_path_registry.hpp"
#include "vidconv_core/session/upload_session_manager.hpp"

namespace vidconv_core {

class ConversionRunner;
class FfmpegToolchain;
class TaskManager;

namespace async {
class WorkerPool;
}

struct SessionSettings {
  UploadSettings uploads;
  // How long teardown waits for cancelled conversions to let go.
  std::chrono::milliseconds cancel_ack_timeout{2000};
};

/**
 * @class ConnectionManager
 * @brief Owns the live connections and routes their messages.
 *
 * Every connection gets its own TaskManager and UploadSessionManager. Inbound
 * messages are JSON objects with an `action` field; every failure while
 * handling one is answered with an `error` message and never closes the
 * connection.
 */
class ConnectionManager {
 public:
  ConnectionManager(async::WorkerPool& worker_pool,
                    ConversionRunner& runner,
                    FfmpegToolchain& toolchain,
                    SessionSettings settings);

  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  ConnectionId open(std::shared_ptr<Connection> connection);

  // Cancels the connection's tasks and aborts its uploads. Unknown ids are ignored.
  void close(ConnectionId id);

  void close_all();

  void handle_message(ConnectionId id, const std::string& message);

  // Sends to every live connection and prunes the ones found closed.
  // Returns the number of connections the message was delivered to.
  size_t broadcast(const nlohmann::json& message);

  size_t connection_count() const;

  std::shared_ptr<TaskManager> task_manager(ConnectionId id) const;
  std::shared_ptr<UploadSessionManager> upload_manager(ConnectionId id) const;

  static nlohmann::json create_error_response(const std::string& message,
                                              std::optional<ErrorKind> kind = std::nullopt);

 private:
  struct ConnectionContext {
    ConnectionId id = 0;
    std::string key;
    std::shared_ptr<Connection> connection;
    std::shared_ptr<TaskManager> tasks;
    std::shared_ptr<UploadSessionManager> uploads;
  };

  std::shared_ptr<ConnectionContext> find(ConnectionId id) const;
  void teardown(ConnectionContext& context);
  void dispatch(ConnectionContext& context, const nlohmann::json& data);
  static void send(ConnectionContext& context, const nlohmann::json& message);

  // Action handlers
  void handle_convert(ConnectionContext& context, const nlohmann::json& data);
  void handle_cancel(ConnectionContext& context, const nlohmann::json& data);
  void handle_check_ffmpeg(ConnectionContext& context);
  void handle_upload(ConnectionContext& context, const nlohmann::json& data);
  void handle_upload_chunk(ConnectionContext& context, const nlohmann::json& data);
  void handle_upload_complete(ConnectionContext& context, const nlohmann::json& data);

  async::WorkerPool& worker_pool_;
  ConversionRunner& runner_;
  FfmpegToolchain& toolchain_;
  const SessionSettings settings_;
  UploadPathRegistry upload_paths_;

  mutable std::mutex mutex_;
  std::unordered_map<ConnectionId, std::shared_ptr<ConnectionContext>> connections_;
  std::atomic<ConnectionId> next_id_{1};
};

}  // namespace vidconv_core
