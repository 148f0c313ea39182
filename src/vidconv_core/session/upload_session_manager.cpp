#include "vidconv_core/session/upload_session_manager.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include "vidconv_core/errors.hpp"
#include "vidconv_core/services/transfer_encoding_service.hpp"
#include "vidconv_core/session/upload_path_registry.hpp"

namespace fs = std::filesystem;

namespace vidconv_core {

UploadSessionManager::UploadSessionManager(std::string connection_key,
                                           UploadSettings settings,
                                           UploadPathRegistry& registry)
    : connection_key_(std::move(connection_key)),
      settings_(std::move(settings)),
      registry_(registry) {}

UploadSessionManager::~UploadSessionManager() {
  try {
    abort_all();
  } catch (const std::exception& e) {
    std::cerr << "[UploadSessionManager] cleanup failed: " << e.what() << std::endl;
  }
}

fs::path UploadSessionManager::resolve_destination(const fs::path& upload_root,
                                                   const std::string& file_name) {
  if (file_name.empty()) {
    throw VidconvError(ErrorKind::InvalidInput, "Missing file_name");
  }
  if (file_name.find('\0') != std::string::npos) {
    throw VidconvError(ErrorKind::InvalidInput, "Invalid file_name: contains a NUL byte");
  }

  const fs::path requested(file_name);
  if (requested.is_absolute() || requested.has_root_name() || requested.has_root_directory()) {
    throw VidconvError(ErrorKind::InvalidInput,
                       "Invalid file_name: absolute paths are not allowed: " + file_name);
  }

  const fs::path relative = requested.lexically_normal();
  for (const fs::path& part : relative) {
    if (part == "..") {
      throw VidconvError(ErrorKind::InvalidInput,
                         "Invalid file_name: escapes the upload directory: " + file_name);
    }
  }
  if (relative.empty() || relative == "." || !relative.has_filename()) {
    throw VidconvError(ErrorKind::InvalidInput, "Invalid file_name: " + file_name);
  }
  return upload_root / relative;
}

int UploadSessionManager::compute_percentage(std::uint64_t uploaded, std::uint64_t total) {
  if (total == 0) {
    return 0;
  }
  std::uint64_t percent = uploaded >= total ? 100 : uploaded * 100 / total;
  return static_cast<int>(std::min<std::uint64_t>(100, percent));
}

// Symlinks inside the root could still point elsewhere.
void UploadSessionManager::ensure_inside_root(const fs::path& destination) const {
  std::error_code ec;
  const fs::path root = fs::weakly_canonical(settings_.upload_root, ec);
  if (ec) {
    throw VidconvError(ErrorKind::IOFailure, "Failed to resolve upload directory: " + ec.message());
  }
  const fs::path parent = fs::weakly_canonical(destination.parent_path(), ec);
  if (ec) {
    throw VidconvError(ErrorKind::IOFailure, "Failed to resolve upload path: " + ec.message());
  }
  const fs::path relative = parent.lexically_relative(root);
  if (relative.empty() || *relative.begin() == "..") {
    throw VidconvError(ErrorKind::InvalidInput,
                       "Invalid file_name: escapes the upload directory: " + destination.string());
  }

  // Opening for write would follow a symlink in the last component.
  if (fs::is_symlink(fs::symlink_status(destination, ec))) {
    throw VidconvError(ErrorKind::InvalidInput,
                       "Invalid file_name: destination is a symbolic link: " + destination.string());
  }
}

std::string UploadSessionManager::begin(const std::string& file_name,
                                        std::uint64_t declared_size) {
  const fs::path destination = resolve_destination(settings_.upload_root, file_name);

  ensure_inside_root(destination);

  std::error_code ec;
  fs::create_directories(destination.parent_path(), ec);
  if (ec) {
    throw VidconvError(ErrorKind::IOFailure, "Failed to initialize upload: " + ec.message());
  }
  ensure_inside_root(destination);

  if (!registry_.claim(destination)) {
    throw VidconvError(ErrorKind::IOFailure,
                       "Failed to initialize upload: " + file_name + " is already being uploaded");
  }

  auto session = std::make_unique<UploadSession>();
  session->file_name = file_name;
  session->path = destination;
  session->declared_size = declared_size;
  session->stream.open(destination, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!session->stream.is_open()) {
    registry_.release(destination);
    throw VidconvError(ErrorKind::IOFailure,
                       "Failed to initialize upload: cannot open " + destination.string());
  }

  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    upload_id = connection_key_ + "_" + std::to_string(next_sequence_++);
    session->id = upload_id;
    sessions_.emplace(upload_id, std::move(session));
  }

  std::cout << "[UploadSessionManager] upload " << upload_id << " started: " << destination
            << " (" << declared_size << " bytes declared)" << std::endl;
  return upload_id;
}

UploadProgress UploadSessionManager::write_chunk(const std::string& upload_id,
                                                 std::optional<std::uint64_t> offset,
                                                 const std::string& encoded_chunk) {
  if (upload_id.empty() || encoded_chunk.empty()) {
    throw VidconvError(ErrorKind::InvalidInput, "Missing upload_id or chunk");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end()) {
    throw VidconvError(ErrorKind::NotFound, "Upload " + upload_id + " not found");
  }
  UploadSession& session = *it->second;

  if (offset && *offset != session.bytes_written) {
    throw VidconvError(ErrorKind::InvalidInput,
                       "Unexpected chunk offset for upload " + upload_id + ": expected " +
                           std::to_string(session.bytes_written) + ", got " +
                           std::to_string(*offset));
  }

  const std::string data = TransferEncodingService::decode_base64(encoded_chunk);
  if (data.empty()) {
    throw VidconvError(ErrorKind::InvalidInput, "Missing upload_id or chunk");
  }

  session.stream.write(data.data(), static_cast<std::streamsize>(data.size()));
  session.stream.flush();
  if (!session.stream) {
    throw VidconvError(ErrorKind::IOFailure,
                       "Failed to process upload chunk: write to " + session.path.string() +
                           " failed");
  }
  session.bytes_written += data.size();

  UploadProgress progress;
  progress.upload_id = upload_id;
  progress.uploaded = session.bytes_written;
  progress.total = session.declared_size;
  progress.progress = compute_percentage(session.bytes_written, session.declared_size);
  return progress;
}

CompletedUpload UploadSessionManager::complete(const std::string& upload_id) {
  if (upload_id.empty()) {
    throw VidconvError(ErrorKind::InvalidInput, "Missing upload_id");
  }

  std::unique_ptr<UploadSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
      throw VidconvError(ErrorKind::NotFound, "Upload " + upload_id + " not found");
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }

  session->stream.close();
  registry_.release(session->path);

  std::error_code ec;
  const bool exists = fs::exists(session->path, ec);
  const std::uintmax_t size = exists ? fs::file_size(session->path, ec) : 0;
  if (!exists || ec || size == 0) {
    throw VidconvError(ErrorKind::IOFailure, "Uploaded file is empty or does not exist");
  }
  if (size != session->bytes_written) {
    throw VidconvError(ErrorKind::IOFailure,
                       "Uploaded file size mismatch: expected " +
                           std::to_string(session->bytes_written) + " bytes, found " +
                           std::to_string(size));
  }

  CompletedUpload result;
  result.upload_id = upload_id;
  result.file_path = session->path.string();
  result.file_name = session->file_name;
  result.file_size = size;
  result.sha256 = TransferEncodingService::sha256_file(session->path);

  std::cout << "[UploadSessionManager] upload " << upload_id << " completed: " << result.file_path
            << " (" << size << " bytes)" << std::endl;
  return result;
}

size_t UploadSessionManager::abort_all() {
  std::vector<std::unique_ptr<UploadSession>> aborted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, session] : sessions_) {
      aborted.push_back(std::move(session));
    }
    sessions_.clear();
  }

  for (auto& session : aborted) {
    session->stream.close();
    registry_.release(session->path);
    if (settings_.keep_partial_uploads) {
      std::cout << "[UploadSessionManager] upload " << session->id
                << " aborted, partial file kept: " << session->path << std::endl;
      continue;
    }
    std::error_code ec;
    fs::remove(session->path, ec);
    if (ec) {
      std::cerr << "[UploadSessionManager] failed to remove partial file " << session->path
                << ": " << ec.message() << std::endl;
    } else {
      std::cout << "[UploadSessionManager] upload " << session->id
                << " aborted, partial file removed: " << session->path << std::endl;
    }
  }
  return aborted.size();
}

size_t UploadSessionManager::open_sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::optional<std::uint64_t> UploadSessionManager::bytes_written(const std::string& upload_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(upload_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second->bytes_written;
}

}  // namespace vidconv_core
