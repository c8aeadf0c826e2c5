#include "security.hpp"
#include <sodium.h>
#include <random>
#include <iostream>

namespace security {

namespace {

std::string random_hex(std::size_t bytes) {
    std::string raw(bytes, '\0');
    if (sodium_init() < 0) {
        std::cerr << "libsodium initialization failed!\n";
        // Fallback to std::random_device
        std::random_device rd;
        for (auto& c : raw) {
            c = static_cast<char>(rd() & 0xff);
        }
    } else {
        randombytes_buf(&raw[0], raw.size());
    }

    std::string hex(bytes * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(),
                   reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    hex.pop_back(); // terminating NUL
    return hex;
}

} // namespace

std::string generate_session_token() {
    return random_hex(16).substr(0, TOKEN_LENGTH);
}

const std::string& instance_id() {
    static const std::string id = random_hex(8);
    return id;
}

std::string normalize_token(const std::string& token) {
    const char* ws = " \t\r\n\f\v";
    auto first = token.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    auto last = token.find_last_not_of(ws);
    return token.substr(first, last - first + 1);
}

} // namespace security
