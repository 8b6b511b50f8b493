#pragma once

#include <cstdint>
#include <string>

namespace fmd::db::model {

struct NonceRecord {
  std::string key;
  std::string val;
  int64_t     created_at_ms = 0;
};

} // namespace fmd::db::model
