#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace vidconv_api {

class Config {
 public:
  std::string host;
  int port;
  std::string upload_dir;
  std::string ffmpeg_path;
  std::string ffprobe_path;
  int num_workers;
  bool keep_partial_uploads;
  int cancel_ack_timeout_ms;
  std::string log_level;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("config must be a JSON object");
    }

    Config config;
    try {
      config.host = json_config.value("host", std::string("localhost"));
      config.port = json_config.value("port", 8765);
      config.upload_dir = json_config.value("upload_dir", std::string("uploads"));
      config.ffmpeg_path = json_config.value("ffmpeg_path", std::string("ffmpeg"));
      config.ffprobe_path = json_config.value("ffprobe_path", std::string("ffprobe"));
      config.num_workers = json_config.value("num_workers", 2);
      config.keep_partial_uploads = json_config.value("keep_partial_uploads", false);
      config.cancel_ack_timeout_ms = json_config.value("cancel_ack_timeout_ms", 2000);
      config.log_level = json_config.value("log_level", std::string("info"));
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  static Config defaults() {
    return from_json(nlohmann::json::object());
  }

 private:
  void validate() const {
    if (host.empty()) {
      throw std::runtime_error("host cannot be empty");
    }
    if (port <= 0 || port > 65535) {
      throw std::runtime_error("port must be between 1 and 65535");
    }
    if (upload_dir.empty()) {
      throw std::runtime_error("upload_dir cannot be empty");
    }
    if (ffmpeg_path.empty()) {
      throw std::runtime_error("ffmpeg_path cannot be empty");
    }
    if (ffprobe_path.empty()) {
      throw std::runtime_error("ffprobe_path cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (cancel_ack_timeout_ms < 0) {
      throw std::runtime_error("cancel_ack_timeout_ms cannot be negative");
    }
    if (log_level != "debug" && log_level != "info" && log_level != "warning" &&
        log_level != "error" && log_level != "critical") {
      throw std::runtime_error("log_level must be one of debug, info, warning, error, critical");
    }
  }
};

}  // namespace vidconv_api
