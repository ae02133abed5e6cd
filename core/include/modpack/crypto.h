#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace modpack {

// Fill buf with n bytes from the kernel CSPRNG (getrandom, then /dev/urandom).
// Throws std::runtime_error if neither source is usable.
void secure_random_bytes(uint8_t* buf, size_t n);

// Lowercase hex of `bytes` random bytes. 16 bytes = a 128-bit token.
std::string random_token_hex(size_t bytes = 16);

// True if s is exactly `hex_chars` lowercase hex digits.
bool is_token_hex(const std::string& s, size_t hex_chars = 32);

} // namespace modpack
