#include "utilities/digest.hpp"

#include <algorithm>
#include <cctype>
#include <sodium.h>
#include <stdexcept>

namespace merkleclaim {

std::string toHex(const uint8_t *data, size_t size) {
  std::string out(size * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), data, size);
  out.resize(size * 2);
  return out;
}

Bytes bytesFromHex(const std::string &hex) {
  std::string digits = hex;
  if (digits.size() >= 2 && digits[0] == '0' &&
      (digits[1] == 'x' || digits[1] == 'X')) {
    digits = digits.substr(2);
  }
  if (digits.size() % 2 != 0) {
    throw std::invalid_argument("Hex string has odd length: " + hex);
  }

  if (digits.empty()) {
    return {};
  }

  Bytes out(digits.size() / 2);
  size_t binLen = 0;
  const char *end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), digits.data(), digits.size(),
                     nullptr, &binLen, &end) != 0 ||
      end != digits.data() + digits.size() || binLen != out.size()) {
    throw std::invalid_argument("Invalid hex string: " + hex);
  }
  return out;
}

Digest digestFromHex(const std::string &hex) {
  Bytes raw = bytesFromHex(hex);
  if (raw.size() != DIGEST_SIZE) {
    throw std::invalid_argument("Digest must be " +
                                std::to_string(DIGEST_SIZE) +
                                " bytes, got " + std::to_string(raw.size()));
  }
  Digest d{};
  std::copy(raw.begin(), raw.end(), d.begin());
  return d;
}

Address addressFromHex(const std::string &hex) {
  Bytes raw = bytesFromHex(hex);
  if (raw.size() != ADDRESS_SIZE) {
    throw std::invalid_argument("Address must be " +
                                std::to_string(ADDRESS_SIZE) +
                                " bytes, got " + std::to_string(raw.size()));
  }
  Address a{};
  std::copy(raw.begin(), raw.end(), a.begin());
  return a;
}

Amount amountFromString(const std::string &text) {
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::invalid_argument("Invalid amount: '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("Amount out of range: " + text);
  }
}

} // namespace merkleclaim
