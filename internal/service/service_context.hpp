#pragma once

#include <cstdint>
#include <memory>

namespace fmd::db { class Repository; }

namespace fmd::service {

struct ServiceOptions {
  // GetDevicesForUser returns at most this many devices.
  uint32_t max_devices_per_user = 1;
  // Positions older than this are removed by PositionTracker::GcDatabase.
  uint64_t position_expiry_sec = 432000;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fmd::db::Repository> repository;
  ServiceOptions                       options;
};

} // namespace fmd::service
