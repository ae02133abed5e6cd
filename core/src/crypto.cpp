#include "modpack/crypto.h"

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <vector>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace modpack {

void secure_random_bytes(uint8_t* buf, size_t n) {
    size_t got = 0;
#if defined(__linux__)
    while (got < n) {
        ssize_t r = ::getrandom(buf + got, n - got, 0);
        if (r > 0) { got += (size_t)r; continue; }
        if (r < 0 && errno == EINTR) continue;
        break;
    }
    if (got == n) return;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        got += std::fread(buf + got, 1, n - got, f);
        std::fclose(f);
        if (got == n) return;
    }
    // never hand out a predictable token
    throw std::runtime_error("secure_random_bytes: no entropy source available");
}

std::string random_token_hex(size_t bytes) {
    static const char* H = "0123456789abcdef";
    std::vector<uint8_t> raw(bytes);
    secure_random_bytes(raw.data(), raw.size());
    std::string out;
    out.resize(bytes * 2);
    for (size_t i = 0; i < bytes; i++) {
        out[i*2+0] = H[(raw[i] >> 4) & 0xF];
        out[i*2+1] = H[(raw[i] >> 0) & 0xF];
    }
    return out;
}

bool is_token_hex(const std::string& s, size_t hex_chars) {
    if (s.size() != hex_chars) return false;
    for (char c : s) {
        bool digit = (c >= '0' && c <= '9');
        bool lower = (c >= 'a' && c <= 'f');
        if (!digit && !lower) return false;
    }
    return true;
}

} // namespace modpack
