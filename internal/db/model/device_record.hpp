#pragma once

#include <cstdint>
#include <string>

namespace fmd::db::model {

/*
  Persistent device_info row.

  logged_in is written on registration but never read back as the
  login state; readers derive it from push_url.
*/

struct DeviceRecord {
  std::string id;

  bool lockable  = false;
  bool logged_in = false;

  int64_t last_exchange_ms = 0;

  std::string hawk_secret;
  std::string push_url;
  std::string accepts;
  std::string access_token;
};

}
