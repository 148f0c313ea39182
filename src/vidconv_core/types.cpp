#include "vidconv_core/types/conversion_request.hpp"

#include <stdexcept>

namespace vidconv_core {

namespace {

// Numeric and string values are both accepted ("crf": 23 or "crf": "23").
std::string string_or_number(const nlohmann::json& value, const std::string& key) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  if (value.is_number()) {
    std::string text = std::to_string(value.get<double>());
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
      text.pop_back();
    }
    return text;
  }
  throw std::invalid_argument("Option '" + key + "' must be a string or a number");
}

}  // namespace

ConversionOptions ConversionOptions::from_json(const nlohmann::json& j) {
  ConversionOptions options;
  if (j.is_null()) {
    return options;
  }
  if (!j.is_object()) {
    throw std::invalid_argument("options must be an object");
  }

  options.codec = j.value("codec", options.codec);
  options.preset = j.value("preset", options.preset);
  options.audio_codec = j.value("audio_codec", options.audio_codec);
  options.audio_bitrate = j.value("audio_bitrate", options.audio_bitrate);

  if (j.contains("crf") && !j.at("crf").is_null()) {
    options.crf = string_or_number(j.at("crf"), "crf");
  }
  if (j.contains("resolution") && !j.at("resolution").is_null()) {
    std::string resolution = j.at("resolution").get<std::string>();
    if (!resolution.empty()) {
      options.resolution = resolution;
    }
  }
  return options;
}

}  // namespace vidconv_core
