#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace vidconv_core {

class TransferEncodingService {
 public:
  /**
   * @brief Decodes standard (RFC 4648) base64 text into raw bytes.
   * @param encoded The base64 text. Surrounding whitespace is ignored.
   * @return The decoded bytes.
   * @throw VidconvError (InvalidInput) if the text is not valid base64.
   */
  static std::string decode_base64(std::string_view encoded);

  /**
   * @brief Encodes raw bytes as base64 text without line breaks.
   */
  static std::string encode_base64(std::string_view data);

  /**
   * @brief Computes the SHA-256 digest of a file on disk.
   * @return Lowercase hex digest.
   * @throw VidconvError (IOFailure) if the file cannot be read.
   */
  static std::string sha256_file(const std::filesystem::path& file_path);
};

}  // namespace vidconv_core
