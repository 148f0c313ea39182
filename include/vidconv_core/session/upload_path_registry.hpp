#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

namespace vidconv_core {

// Destinations inside the upload root that an open upload is writing to.
// Shared by every connection so two uploads never write the same file.
class UploadPathRegistry {
 public:
  UploadPathRegistry() = default;

  UploadPathRegistry(const UploadPathRegistry&) = delete;
  UploadPathRegistry& operator=(const UploadPathRegistry&) = delete;

  // Returns false if the path is already claimed.
  bool claim(const std::filesystem::path& path);
  void release(const std::filesystem::path& path);
  bool is_claimed(const std::filesystem::path& path) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> claimed_;
};

}  // namespace vidconv_core
