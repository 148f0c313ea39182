#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace vidconv_tests {

std::filesystem::path TestUtilities::create_temp_dir(const std::string& prefix) {
  static std::atomic<unsigned long long> counter{0};
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
                              (prefix + "_" + std::to_string(stamp) + "_" +
                               std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::remove_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void TestUtilities::write_file(const std::filesystem::path& path, const std::string& content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to create test file: " + path.string());
  }
  out << content;
}

std::string TestUtilities::read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool TestUtilities::wait_until(const std::function<bool()>& predicate,
                               std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

void TempDirectoryTestBase::SetUp() {
  temp_dir_ = TestUtilities::create_temp_dir("vidconv_test");
}

void TempDirectoryTestBase::TearDown() {
  TestUtilities::remove_temp_dir(temp_dir_);
}

}  // namespace vidconv_tests
