#include "data/types.hpp"
#include "crypto/hasher.hpp"
#include <stdexcept>

namespace autonomi {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

XorName XorName::from_content(const Bytes& content) {
  return XorName(crypto::Hasher::sha3_256(content));
}

XorName XorName::from_content(const uint8_t* data, size_t length) {
  return XorName(crypto::Hasher::sha3_256(data, length));
}

XorName XorName::from_hex(const std::string& hex) {
  if (hex.size() != SIZE * 2) {
    throw std::invalid_argument("XorName: expected " + std::to_string(SIZE * 2) + " hex characters");
  }

  std::array<uint8_t, SIZE> bytes{};
  for (size_t i = 0; i < SIZE; ++i) {
    int high = hex_value(hex[2 * i]);
    int low = hex_value(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("XorName: invalid hex character");
    }
    bytes[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return XorName(bytes);
}

std::string XorName::to_hex() const {
  static const char hex[] = "0123456789abcdef";

  std::string result(SIZE * 2, '0');
  for (size_t i = 0; i < SIZE; ++i) {
    result[2 * i] = hex[bytes_[i] >> 4];
    result[2 * i + 1] = hex[bytes_[i] & 0xf];
  }
  return result;
}

} // namespace autonomi
