#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vidconv_core {

class UploadPathRegistry;

struct UploadSettings {
  std::filesystem::path upload_root = "uploads";
  // Partial files of uploads that never completed are deleted unless set.
  bool keep_partial_uploads = false;
};

struct UploadProgress {
  std::string upload_id;
  int progress = 0;
  std::uint64_t uploaded = 0;
  std::uint64_t total = 0;
};

struct CompletedUpload {
  std::string upload_id;
  std::string file_path;
  std::string file_name;
  std::uint64_t file_size = 0;
  std::string sha256;
};

/**
 * @class UploadSessionManager
 * @brief Chunked uploads of one connection into the shared upload root.
 *
 * An upload is opened by begin(), fed strictly sequential base64 chunks by
 * write_chunk() and closed by complete(). Destinations are always inside the
 * upload root; names that would leave it are rejected. Failures are reported
 * by throwing VidconvError and leave the session table untouched, except for
 * complete() which always discards the session.
 */
class UploadSessionManager {
 public:
  UploadSessionManager(std::string connection_key,
                       UploadSettings settings,
                       UploadPathRegistry& registry);

  // Aborts every upload that is still open.
  ~UploadSessionManager();

  UploadSessionManager(const UploadSessionManager&) = delete;
  UploadSessionManager& operator=(const UploadSessionManager&) = delete;

  std::string begin(const std::string& file_name, std::uint64_t declared_size);

  // A present offset must equal the number of bytes written so far.
  UploadProgress write_chunk(const std::string& upload_id,
                             std::optional<std::uint64_t> offset,
                             const std::string& encoded_chunk);

  CompletedUpload complete(const std::string& upload_id);

  // Closes every open upload and applies the partial-file policy.
  // Returns the number of uploads aborted.
  size_t abort_all();

  size_t open_sessions() const;

  std::optional<std::uint64_t> bytes_written(const std::string& upload_id) const;

  // Maps a client supplied name to a path below upload_root.
  // Throws VidconvError (InvalidInput) for names escaping the root.
  static std::filesystem::path resolve_destination(const std::filesystem::path& upload_root,
                                                   const std::string& file_name);

  static int compute_percentage(std::uint64_t uploaded, std::uint64_t total);

 private:
  struct UploadSession {
    std::string id;
    std::string file_name;
    std::filesystem::path path;
    std::uint64_t declared_size = 0;
    std::uint64_t bytes_written = 0;
    std::ofstream stream;
  };

  void ensure_inside_root(const std::filesystem::path& destination) const;

  const std::string connection_key_;
  const UploadSettings settings_;
  UploadPathRegistry& registry_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<UploadSession>> sessions_;
  unsigned long long next_sequence_ = 0;
};

}  // namespace vidconv_core
