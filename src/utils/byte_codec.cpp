#include "utils/byte_codec.hpp"
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace utils {

void write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Byte codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("Byte codec: Failed to write to output stream");
  }
}

void read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(debug) << "Byte codec: Failed to read " << size << " bytes from input stream";
    throw CodecError("Byte codec: Unexpected end of input");
  }
}

bool at_end(std::istream& input) {
  return input.peek() == std::char_traits<char>::eof();
}

} // namespace utils
} // namespace autonomi
