#ifndef MERKLECLAIM_DIGEST_HPP
#define MERKLECLAIM_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

namespace merkleclaim {

/// Digest size for SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;
/// Width of a recipient identity.
inline constexpr size_t ADDRESS_SIZE = 20;
/// Width of an amount inside a leaf encoding (big-endian, zero padded).
inline constexpr size_t AMOUNT_FIELD_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;
using Address = std::array<uint8_t, ADDRESS_SIZE>;
using Amount = uint64_t;
using Bytes = std::vector<uint8_t>;

/**
 * @brief Hex-encode a byte range (lowercase, no prefix).
 */
std::string toHex(const uint8_t *data, size_t size);

template <size_t N> std::string toHex(const std::array<uint8_t, N> &bytes) {
  return toHex(bytes.data(), N);
}

inline std::string toHex(const Bytes &bytes) {
  return toHex(bytes.data(), bytes.size());
}

/**
 * @brief Decode hex of any even length. An optional "0x" prefix is accepted.
 * @throws std::invalid_argument on odd length or non-hex characters.
 */
Bytes bytesFromHex(const std::string &hex);

/**
 * @brief Decode exactly 32 bytes of hex.
 * @throws std::invalid_argument if the input is not a 32-byte hex string.
 */
Digest digestFromHex(const std::string &hex);

/**
 * @brief Decode exactly 20 bytes of hex.
 * @throws std::invalid_argument if the input is not a 20-byte hex string.
 */
Address addressFromHex(const std::string &hex);

/**
 * @brief Parse a decimal amount. Only digits are accepted: no sign, no
 * whitespace, no trailing characters.
 * @throws std::invalid_argument if malformed or larger than Amount.
 */
Amount amountFromString(const std::string &text);

/// Hash functor so Address can key unordered containers.
struct AddressHash {
  size_t operator()(const Address &a) const noexcept {
    uint64_t v = 0;
    std::memcpy(&v, a.data(), sizeof(v));
    return std::hash<uint64_t>{}(v);
  }
};

} // namespace merkleclaim

#endif // MERKLECLAIM_DIGEST_HPP
