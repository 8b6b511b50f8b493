#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace fmd::util {

/*
  UUID helpers

  Device ids and nonce tokens are random RFC4122 v4 UUIDs in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace fmd::util
