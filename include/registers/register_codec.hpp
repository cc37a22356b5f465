#ifndef AUTONOMI_REGISTER_CODEC_HPP
#define AUTONOMI_REGISTER_CODEC_HPP

#include <cstdint>
#include "registers/register.hpp"

namespace autonomi {
namespace registers {

// ---- WIRE FORMAT ----
// "AREG" | version u8 | owner | meta[32] | writer count u32 | writers |
// entry count u32 | entries (author, payload, parents, signature)
// Variable fields are u32 length prefixed, integers big-endian
constexpr uint8_t kRegisterFormatVersion = 1;

Bytes encode_register(const Register& reg);
// Entries are admitted through Register::merge, so a decoded register has
// passed signature, permission and parent checks. Throws RegisterError
Register decode_register(const Bytes& bytes);

} // namespace registers
} // namespace autonomi

#endif // AUTONOMI_REGISTER_CODEC_HPP
