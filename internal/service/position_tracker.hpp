#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/position.hpp"
#include "service_context.hpp"

namespace fmd::service {

/*
  Latest-only location store.

  SetDeviceLocation replaces whatever was stored for the device; the
  stored time is the server's receipt time. Coordinates are kept at
  single precision.
*/
class PositionTracker {
public:
  explicit PositionTracker(ServiceContext ctx);

  void SetDeviceLocation(const std::string& device_id, const model::Position& position);

  // Zero or one element.
  std::vector<model::Position> GetPositions(const std::string& device_id);

  // Deletes positions older than the configured expiry. Returns rows removed.
  uint64_t GcDatabase();
  uint64_t GcDatabase(std::chrono::seconds expiry);

private:
  ServiceContext ctx_;
};

} // namespace fmd::service
