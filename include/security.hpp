#pragma once

#include <string>

namespace security {

constexpr std::size_t TOKEN_LENGTH = 8;

// Random 128-bit identifier from libsodium, hex encoded and cut to TOKEN_LENGTH
std::string generate_session_token();

// Stable per-process identifier, used to ignore our own discovery broadcasts
const std::string& instance_id();

// Strips surrounding whitespace from a room code typed by the user
std::string normalize_token(const std::string& token);

} // namespace security
