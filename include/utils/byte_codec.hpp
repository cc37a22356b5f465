#ifndef AUTONOMI_UTILS_BYTE_CODEC_HPP
#define AUTONOMI_UTILS_BYTE_CODEC_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <boost/endian/conversion.hpp>

namespace autonomi {
namespace utils {

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// ---- STREAM OPERATIONS ----
// Writes raw bytes to an output stream
void write_bytes(std::ostream& output, const void* data, std::size_t size);
// Reads exactly size bytes from an input stream
void read_bytes(std::istream& input, void* data, std::size_t size);
// True when the stream has no unread bytes left
bool at_end(std::istream& input);


// ---- NETWORK BYTE ORDER INTEGERS ----
template <typename T>
void write_uint(std::ostream& output, T host_value) {
  static_assert(std::is_unsigned<T>::value, "write_uint requires an unsigned type");
  T network_value = boost::endian::native_to_big(host_value);
  write_bytes(output, &network_value, sizeof(network_value));
}

template <typename T>
T read_uint(std::istream& input) {
  static_assert(std::is_unsigned<T>::value, "read_uint requires an unsigned type");
  T network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

} // namespace utils
} // namespace autonomi

#endif // AUTONOMI_UTILS_BYTE_CODEC_HPP
