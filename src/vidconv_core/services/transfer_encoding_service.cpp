#include "vidconv_core/services/transfer_encoding_service.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include "vidconv_core/errors.hpp"

namespace vidconv_core {

std::string TransferEncodingService::decode_base64(std::string_view encoded) {
  std::string input;
  input.reserve(encoded.size());
  for (char c : encoded) {
    if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
      input.push_back(c);
    }
  }
  if (input.empty()) {
    return "";
  }
  if (input.size() % 4 != 0) {
    throw VidconvError(ErrorKind::InvalidInput, "Invalid base64 chunk: length is not a multiple of 4");
  }

  // Padding is at most two '=' and only at the very end.
  size_t padding = 0;
  const size_t first_pad = input.find('=');
  if (first_pad != std::string::npos) {
    padding = input.size() - first_pad;
    if (padding > 2 || input.find_first_not_of('=', first_pad) != std::string::npos) {
      throw VidconvError(ErrorKind::InvalidInput, "Invalid base64 chunk: misplaced padding");
    }
  }

  std::vector<unsigned char> buffer(input.size() / 4 * 3);
  int decoded_size = EVP_DecodeBlock(buffer.data(),
                                     reinterpret_cast<const unsigned char*>(input.data()),
                                     static_cast<int>(input.size()));
  if (decoded_size < 0) {
    throw VidconvError(ErrorKind::InvalidInput, "Invalid base64 chunk");
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  return std::string(reinterpret_cast<const char*>(buffer.data()),
                     static_cast<size_t>(decoded_size) - padding);
}

std::string TransferEncodingService::encode_base64(std::string_view data) {
  if (data.empty()) {
    return "";
  }
  std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
  int encoded_size = EVP_EncodeBlock(buffer.data(),
                                     reinterpret_cast<const unsigned char*>(data.data()),
                                     static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char*>(buffer.data()),
                     static_cast<size_t>(encoded_size));
}

std::string TransferEncodingService::sha256_file(const std::filesystem::path& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    throw VidconvError(ErrorKind::IOFailure, "Cannot open file for hashing: " + file_path.string());
  }

  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw VidconvError(ErrorKind::IOFailure, "Failed to create SHA256 context");
  }
  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw VidconvError(ErrorKind::IOFailure, "Failed to initialize SHA256 digest");
  }

  char buffer[64 * 1024];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    if (EVP_DigestUpdate(mdctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
      EVP_MD_CTX_free(mdctx);
      throw VidconvError(ErrorKind::IOFailure, "Failed to update SHA256 digest");
    }
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw VidconvError(ErrorKind::IOFailure, "Failed to finalize SHA256 digest");
  }
  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace vidconv_core
