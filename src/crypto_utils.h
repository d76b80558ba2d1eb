#ifndef CRYPTO_UTILS_H
#define CRYPTO_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

namespace Crypto {
// Hash functions
std::string sha256(const std::string &input);

// Hex helpers
std::string toHex(const Bytes &data);
std::optional<Bytes> safeFromHex(const std::string &hex,
                                 const std::string &context = "");

// Short printable fingerprint of a key, for logs
std::string fingerprint(const Bytes &publicKey);

inline Bytes stringToBytes(const std::string &input) {
  return Bytes(input.begin(), input.end());
}
} // namespace Crypto

#endif // CRYPTO_UTILS_H
