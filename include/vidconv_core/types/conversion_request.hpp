#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace vidconv_core {

struct ConversionOptions {
  std::string codec = "libx264";
  std::string preset = "medium";
  std::string crf = "23";
  std::string audio_codec = "aac";
  std::string audio_bitrate = "128k";
  std::optional<std::string> resolution;

  // Missing keys keep their defaults. Throws std::invalid_argument for a
  // non-object and nlohmann::json::type_error for wrongly typed values.
  static ConversionOptions from_json(const nlohmann::json& j);
};

struct ConversionRequest {
  std::string input_file;
  std::string output_file;
  ConversionOptions options;
};

}  // namespace vidconv_core
