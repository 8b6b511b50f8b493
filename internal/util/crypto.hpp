#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace fmd::util {

/*
  OpenSSL-backed digest helpers.

  All binary outputs are returned as std::string byte containers.
*/

// Cryptographically strong random bytes (RAND_bytes). Throws on RNG failure.
std::string RandomBytes(std::size_t n);

std::string Base64Encode(std::string_view bytes);

std::string Sha256(std::string_view data);
std::string HmacSha256(std::string_view key, std::string_view message);
std::string Md5(std::string_view data);

std::string ToHex(std::string_view bytes);

// Constant-time equality; unequal lengths compare false without early exit on content.
bool ConstantTimeEquals(std::string_view a, std::string_view b);

} // namespace fmd::util
