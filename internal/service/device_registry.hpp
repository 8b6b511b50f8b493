#pragma once

#include <string>
#include <vector>

#include "internal/model/device.hpp"
#include "service_context.hpp"

namespace fmd::service {

/*
  Device identity, ownership and per-device state.

  Every call runs in exactly one repository transaction. Storage
  failures surface as util::Error(Storage|Timeout); a missing device is
  util::Error(UnknownDevice) where the caller asked for one by id.
*/
class DeviceRegistry {
public:
  explicit DeviceRegistry(ServiceContext ctx);

  // Updates the device in place when the user already owns it, otherwise
  // inserts the device and its mapping. Returns the (possibly generated) id.
  std::string Register(const std::string& user_id, model::Device device);

  model::Device GetDeviceInfo(const std::string& device_id);

  model::DeviceOwner GetUserFromDevice(const std::string& device_id);

  // Moves old_user_id's devices to user_id first when the ids differ.
  // Newest association first, capped at max_devices_per_user.
  std::vector<model::DeviceListEntry> GetDevicesForUser(const std::string& user_id, const std::string& old_user_id = {});

  void SetAccessToken(const std::string& device_id, const std::string& token);
  void SetDeviceLock(const std::string& device_id, bool lockable);
  void Touch(const std::string& device_id);

  // Commands, positions, mapping, device row; in that order.
  void DeleteDevice(const std::string& device_id);

private:
  std::vector<model::DeviceListEntry> ListDevices(const std::string& user_id);

  ServiceContext ctx_;
};

} // namespace fmd::service
