#pragma once

#include <string>

#include "internal/db/model/device_record.hpp"

namespace fmd::db::model {

// device_info joined with its owning user_device_map row.
struct DeviceInfoRecord {
  DeviceRecord device;
  std::string  user_id;
  std::string  name;
};

} // namespace fmd::db::model
