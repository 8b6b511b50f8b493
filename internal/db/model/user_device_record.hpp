#pragma once

#include <cstdint>
#include <string>

namespace fmd::db::model {

// user_device_map row; (user_id, device_id) is unique.
struct UserDeviceRecord {
  std::string user_id;
  std::string device_id;
  std::string name;
  int64_t     created_at_ms = 0;
};

} // namespace fmd::db::model
