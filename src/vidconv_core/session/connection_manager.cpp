#include "vidconv_core/session/connection_manager.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"
#include "vidconv_core/session/task_manager.hpp"
#include "vidconv_core/types/conversion_request.hpp"

namespace vidconv_core {

namespace {

// Missing and non-string values both read as empty.
std::string string_field(const nlohmann::json& data, const char* key) {
  auto it = data.find(key);
  if (it == data.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

// Non-negative integers only; values past INT64_MAX arrive as unsigned.
std::optional<std::uint64_t> size_value(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  return std::nullopt;
}

}  // namespace

ConnectionManager::ConnectionManager(async::WorkerPool& worker_pool,
                                     ConversionRunner& runner,
                                     FfmpegToolchain& toolchain,
                                     SessionSettings settings)
    : worker_pool_(worker_pool),
      runner_(runner),
      toolchain_(toolchain),
      settings_(std::move(settings)) {
  std::error_code ec;
  std::filesystem::create_directories(settings_.uploads.upload_root, ec);
  if (ec) {
    std::cerr << "[ConnectionManager] could not create upload directory "
              << settings_.uploads.upload_root << ": " << ec.message() << std::endl;
  }
}

ConnectionManager::~ConnectionManager() {
  close_all();
}

ConnectionId ConnectionManager::open(std::shared_ptr<Connection> connection) {
  if (!connection) {
    throw std::invalid_argument("connection must not be null");
  }

  auto context = std::make_shared<ConnectionContext>();
  context->id = next_id_++;
  context->key = std::to_string(context->id);
  context->connection = std::move(connection);
  context->tasks =
      std::make_shared<TaskManager>(context->key, context->connection, worker_pool_, runner_);
  context->uploads =
      std::make_shared<UploadSessionManager>(context->key, settings_.uploads, upload_paths_);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.emplace(context->id, context);
  }

  std::cout << "[ConnectionManager] new connection " << context->id << " from "
            << context->connection->remote_address() << std::endl;
  return context->id;
}

void ConnectionManager::close(ConnectionId id) {
  std::shared_ptr<ConnectionContext> context;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
      return;
    }
    context = std::move(it->second);
    connections_.erase(it);
  }

  teardown(*context);
  std::cout << "[ConnectionManager] connection " << id << " closed ("
            << context->connection->remote_address() << ")" << std::endl;
}

void ConnectionManager::close_all() {
  std::vector<ConnectionId> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ids.reserve(connections_.size());
    for (const auto& [id, context] : connections_) {
      ids.push_back(id);
    }
  }
  for (ConnectionId id : ids) {
    close(id);
  }
}

void ConnectionManager::teardown(ConnectionContext& context) {
  size_t cancelled = context.tasks->cancel_all(settings_.cancel_ack_timeout);
  size_t aborted = context.uploads->abort_all();
  if (cancelled > 0 || aborted > 0) {
    std::cout << "[ConnectionManager] connection " << context.id << ": cancelled " << cancelled
              << " task(s), aborted " << aborted << " upload(s)" << std::endl;
  }
}

size_t ConnectionManager::broadcast(const nlohmann::json& message) {
  std::vector<std::shared_ptr<ConnectionContext>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(connections_.size());
    for (const auto& [id, context] : connections_) {
      targets.push_back(context);
    }
  }

  const std::string payload = message.dump();
  size_t delivered = 0;
  std::vector<ConnectionId> dead;
  for (const auto& context : targets) {
    if (!context->connection->is_open()) {
      dead.push_back(context->id);
      continue;
    }
    try {
      context->connection->send_text(payload);
      ++delivered;
    } catch (const std::exception& e) {
      std::cerr << "[ConnectionManager] broadcast to connection " << context->id
                << " failed: " << e.what() << std::endl;
      dead.push_back(context->id);
    }
  }

  for (ConnectionId id : dead) {
    close(id);
  }
  return delivered;
}

size_t ConnectionManager::connection_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::shared_ptr<TaskManager> ConnectionManager::task_manager(ConnectionId id) const {
  auto context = find(id);
  return context ? context->tasks : nullptr;
}

std::shared_ptr<UploadSessionManager> ConnectionManager::upload_manager(ConnectionId id) const {
  auto context = find(id);
  return context ? context->uploads : nullptr;
}

std::shared_ptr<ConnectionManager::ConnectionContext> ConnectionManager::find(
    ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second;
}

nlohmann::json ConnectionManager::create_error_response(const std::string& message,
                                                        std::optional<ErrorKind> kind) {
  nlohmann::json response = {{"type", "error"}, {"message", message}};
  if (kind) {
    response["code"] = kind_to_string(*kind);
  }
  return response;
}

void ConnectionManager::send(ConnectionContext& context, const nlohmann::json& message) {
  try {
    context.connection->send_text(message.dump());
  } catch (const std::exception& e) {
    std::cerr << "[ConnectionManager] send to connection " << context.id
              << " failed: " << e.what() << std::endl;
  }
}

void ConnectionManager::handle_message(ConnectionId id, const std::string& message) {
  auto context = find(id);
  if (!context) {
    std::cerr << "[ConnectionManager] message for unknown connection " << id << " dropped"
              << std::endl;
    return;
  }

  nlohmann::json data;
  try {
    data = nlohmann::json::parse(message);
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "[ConnectionManager] connection " << id << " sent invalid JSON: " << e.what()
              << std::endl;
    send(*context, create_error_response("Invalid JSON format", ErrorKind::ProtocolError));
    return;
  }

  if (!data.is_object()) {
    send(*context, create_error_response("Invalid message format", ErrorKind::ProtocolError));
    return;
  }

  try {
    dispatch(*context, data);
  } catch (const VidconvError& e) {
    std::cerr << "[ConnectionManager] connection " << id << ": " << e.what() << std::endl;
    send(*context, create_error_response(e.what(), e.kind()));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ConnectionManager] connection " << id << " sent a malformed field: "
              << e.what() << std::endl;
    send(*context, create_error_response("Invalid message format", ErrorKind::ProtocolError));
  } catch (const std::exception& e) {
    std::cerr << "[ConnectionManager] connection " << id << " error: " << e.what() << std::endl;
    send(*context, create_error_response(std::string("Server error: ") + e.what()));
  }
}

void ConnectionManager::dispatch(ConnectionContext& context, const nlohmann::json& data) {
  const std::string action = string_field(data, "action");

  if (action == "convert") {
    handle_convert(context, data);
  } else if (action == "cancel") {
    handle_cancel(context, data);
  } else if (action == "check_ffmpeg") {
    handle_check_ffmpeg(context);
  } else if (action == "upload") {
    handle_upload(context, data);
  } else if (action == "upload_chunk") {
    handle_upload_chunk(context, data);
  } else if (action == "upload_complete") {
    handle_upload_complete(context, data);
  } else {
    throw VidconvError(ErrorKind::ProtocolError, "Unknown action: " + action);
  }
}

void ConnectionManager::handle_convert(ConnectionContext& context, const nlohmann::json& data) {
  ConversionRequest request;
  request.input_file = string_field(data, "input_file");
  request.output_file = string_field(data, "output_file");
  if (request.input_file.empty() || request.output_file.empty()) {
    throw VidconvError(ErrorKind::InvalidInput, "Missing input_file or output_file");
  }

  try {
    request.options = ConversionOptions::from_json(data.value("options", nlohmann::json()));
  } catch (const std::invalid_argument& e) {
    throw VidconvError(ErrorKind::InvalidInput, e.what());
  } catch (const nlohmann::json::type_error& e) {
    throw VidconvError(ErrorKind::InvalidInput, std::string("Invalid options: ") + e.what());
  }

  context.tasks->submit(request, [&context](const std::string& task_id) {
    send(context, {{"type", "task_started"},
                   {"task_id", task_id},
                   {"message", "Conversion task started"}});
  });
}

void ConnectionManager::handle_cancel(ConnectionContext& context, const nlohmann::json& data) {
  const std::string task_id = string_field(data, "task_id");
  if (task_id.empty()) {
    throw VidconvError(ErrorKind::InvalidInput, "Missing task_id");
  }

  context.tasks->cancel(task_id);
  send(context, {{"type", "task_cancelled"},
                 {"task_id", task_id},
                 {"message", "Conversion task cancelled"}});
}

void ConnectionManager::handle_check_ffmpeg(ConnectionContext& context) {
  const bool available = toolchain_.is_available();
  send(context, {{"type", "ffmpeg_check"},
                 {"available", available},
                 {"message", FfmpegToolchain::availability_message(available)}});
}

void ConnectionManager::handle_upload(ConnectionContext& context, const nlohmann::json& data) {
  const std::string file_name = string_field(data, "file_name");
  if (file_name.empty()) {
    throw VidconvError(ErrorKind::InvalidInput, "Missing file_name");
  }

  std::uint64_t file_size = 0;
  auto size_it = data.find("file_size");
  if (size_it != data.end() && !size_it->is_null()) {
    std::optional<std::uint64_t> size = size_value(*size_it);
    if (!size) {
      throw VidconvError(ErrorKind::InvalidInput, "Invalid file_size");
    }
    file_size = *size;
  }

  const std::string upload_id = context.uploads->begin(file_name, file_size);
  send(context, {{"type", "upload_init"},
                 {"upload_id", upload_id},
                 {"message", "Upload initialized successfully"}});
}

void ConnectionManager::handle_upload_chunk(ConnectionContext& context,
                                            const nlohmann::json& data) {
  std::optional<std::uint64_t> offset;
  auto offset_it = data.find("offset");
  if (offset_it != data.end() && !offset_it->is_null()) {
    offset = size_value(*offset_it);
    if (!offset) {
      throw VidconvError(ErrorKind::InvalidInput, "Invalid offset");
    }
  }

  UploadProgress progress = context.uploads->write_chunk(
      string_field(data, "upload_id"), offset, string_field(data, "chunk"));
  send(context, {{"type", "upload_progress"},
                 {"upload_id", progress.upload_id},
                 {"progress", progress.progress},
                 {"uploaded", progress.uploaded},
                 {"total", progress.total}});
}

void ConnectionManager::handle_upload_complete(ConnectionContext& context,
                                               const nlohmann::json& data) {
  CompletedUpload upload = context.uploads->complete(string_field(data, "upload_id"));
  send(context, {{"type", "upload_complete"},
                 {"upload_id", upload.upload_id},
                 {"file_path", upload.file_path},
                 {"file_name", upload.file_name},
                 {"file_size", upload.file_size},
                 {"sha256", upload.sha256},
                 {"message", "File uploaded successfully"}});
}

}  // namespace vidconv_core
