#include "uuid.hpp"

#include <iomanip>
#include <sstream>

#include "internal/util/crypto.hpp"

namespace fmd::util {

UUID GenerateUUID() {
  UUID id{};
  const auto bytes = RandomBytes(id.size());
  for (size_t i = 0; i < id.size(); ++i)
    id[i] = static_cast<uint8_t>(bytes[i]);

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace fmd::util
