#pragma once

#include <optional>
#include <string>

#include "internal/model/command.hpp"
#include "service_context.hpp"

namespace fmd::service {

/*
  At most one pending command per (device, type).

  StoreCommand replaces an existing command of the same type; GetPending
  hands out the oldest command exactly once.
*/
class CommandQueue {
public:
  explicit CommandQueue(ServiceContext ctx);

  void StoreCommand(const std::string& device_id, const std::string& command, const std::string& type);

  // Removes and returns the oldest command, refreshing the device's last
  // exchange time. Empty when nothing is queued.
  std::optional<model::PendingCommand> GetPending(const std::string& device_id);

  void PurgeCommands(const std::string& device_id);

private:
  ServiceContext ctx_;
};

} // namespace fmd::service
