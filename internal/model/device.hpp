#pragma once

#include <cstdint>
#include <string>

namespace fmd::model {

struct Device {
  // Generated (UUID v4) on registration when empty.
  std::string id;
  std::string user_id;
  std::string name;

  bool lockable  = false;
  // Derived from push_url on read.
  bool logged_in = false;

  // Unix milliseconds.
  int64_t last_exchange_ms = 0;

  std::string hawk_secret;
  std::string push_url;
  std::string accepts;
  std::string access_token;
};

struct DeviceListEntry {
  std::string id;
  // Falls back to id when no display name is stored.
  std::string name;
};

struct DeviceOwner {
  std::string user_id;
  std::string name;
};

} // namespace fmd::model
