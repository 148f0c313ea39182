#include "vidconv_core/session/upload_path_registry.hpp"

namespace vidconv_core {

bool UploadPathRegistry::claim(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return claimed_.insert(path.lexically_normal().string()).second;
}

void UploadPathRegistry::release(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  claimed_.erase(path.lexically_normal().string());
}

bool UploadPathRegistry::is_claimed(const std::filesystem::path& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return claimed_.count(path.lexically_normal().string()) > 0;
}

}  // namespace vidconv_core
