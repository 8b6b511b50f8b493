#pragma once

#include <cstdint>
#include <string>

namespace fmd::db::model {

// Coordinates are kept at single precision, matching the REAL columns.
struct PositionRecord {
  std::string device_id;
  int64_t     time_ms   = 0;
  float       latitude  = 0;
  float       longitude = 0;
  float       altitude  = 0;
  float       accuracy  = 0;
};

} // namespace fmd::db::model
