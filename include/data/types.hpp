#ifndef AUTONOMI_DATA_TYPES_HPP
#define AUTONOMI_DATA_TYPES_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace autonomi {

using Bytes = std::vector<uint8_t>;

// 32-byte content hash; the only key used by the chunk and register stores
class XorName {
public:
  static constexpr size_t SIZE = 32;

  XorName() = default;
  explicit XorName(const std::array<uint8_t, SIZE>& bytes) : bytes_(bytes) {}

  // SHA3-256 of the given content
  static XorName from_content(const Bytes& content);
  static XorName from_content(const uint8_t* data, size_t length);
  // Parses 64 hex characters; throws std::invalid_argument otherwise
  static XorName from_hex(const std::string& hex);

  const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }
  const uint8_t* data() const { return bytes_.data(); }
  std::string to_hex() const;
  // First bytes in hex, for log lines
  std::string short_hex() const { return to_hex().substr(0, 12); }

  bool operator==(const XorName& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const XorName& other) const { return bytes_ != other.bytes_; }
  bool operator<(const XorName& other) const { return bytes_ < other.bytes_; }

private:
  std::array<uint8_t, SIZE> bytes_{};
};

using Address = XorName;

inline std::ostream& operator<<(std::ostream& os, const XorName& name) {
  os << name.to_hex();
  return os;
}

} // namespace autonomi

namespace std {
template <>
struct hash<autonomi::XorName> {
  size_t operator()(const autonomi::XorName& name) const noexcept {
    size_t value = 0;
    for (size_t i = 0; i < sizeof(size_t); ++i) {
      value = (value << 8) | name.bytes()[i];
    }
    return value;
  }
};
} // namespace std

#endif // AUTONOMI_DATA_TYPES_HPP
