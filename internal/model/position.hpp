#pragma once

#include <cstdint>

namespace fmd::model {

struct Position {
  double latitude  = 0;
  double longitude = 0;
  double altitude  = 0;
  double accuracy  = 0;
  // Unix seconds; set by the server when the position is stored.
  int64_t time = 0;
};

} // namespace fmd::model
