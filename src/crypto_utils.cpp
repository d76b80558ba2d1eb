#include "crypto_utils.h"
#include "logging.h"
#include <cctype>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace Crypto {

std::string sha256(const std::string &input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              EVP_MD_CTX_free);
  if (!ctx)
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1)
    throw std::runtime_error("sha256: digest failed");

  std::ostringstream hexStream;
  for (unsigned int i = 0; i < length; i++) {
    hexStream << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
  }
  return hexStream.str();
}

std::string toHex(const Bytes &data) {
  static const char hex_chars[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(data.size() * 2);

  for (unsigned char byte : data) {
    hex.push_back(hex_chars[(byte >> 4) & 0x0F]);
    hex.push_back(hex_chars[byte & 0x0F]);
  }
  return hex;
}

// Quiet failure: callers decide whether a bad hex field is a violation.
std::optional<Bytes> safeFromHex(const std::string &hex,
                                 const std::string &context) {
  if (hex.size() % 2 != 0) {
    LOG_D("[hex]") << "[" << context << "] odd-length hex string: " << hex.size();
    return std::nullopt;
  }

  const size_t MAX_SAFE_LENGTH = 1000000; // 1 MB of hex chars
  if (hex.size() > MAX_SAFE_LENGTH) {
    LOG_D("[hex]") << "[" << context << "] hex string too long: " << hex.size();
    return std::nullopt;
  }

  Bytes bytes;
  bytes.reserve(hex.size() / 2);

  auto hexToNibble = [](unsigned char c) -> int {
    if ('0' <= c && c <= '9') return c - '0';
    if ('a' <= c && c <= 'f') return c - 'a' + 10;
    if ('A' <= c && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hexToNibble(static_cast<unsigned char>(hex[i]));
    int low = hexToNibble(static_cast<unsigned char>(hex[i + 1]));
    if (high == -1 || low == -1) {
      LOG_D("[hex]") << "[" << context << "] invalid hex character at pos " << i;
      return std::nullopt;
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }

  return bytes;
}

std::string fingerprint(const Bytes &publicKey) {
  if (publicKey.empty())
    return "<none>";
  return sha256(std::string(publicKey.begin(), publicKey.end())).substr(0, 16);
}

} // namespace Crypto
