#pragma once

#include <memory>
#include <string_view>

#include "internal/auth/hawk.hpp"
#include "internal/model/device.hpp"

namespace fmd::service { class DeviceRegistry; }

namespace fmd::auth {

/*
  Inbound request check: Authorization header -> device -> MAC.

  Throws util::Error with NoAuth, NotHawkAuth, UnknownDevice or
  InvalidSignature. Nonce consumption stays with the caller
  (NonceStore::VerifyAndConsume).
*/
class AuthGuard {
 public:
  AuthGuard(std::shared_ptr<service::DeviceRegistry> registry, HawkAuthenticator authenticator);

  // Returns the authenticated device.
  model::Device Authenticate(const RequestInfo& request, std::string_view body) const;

 private:
  std::shared_ptr<service::DeviceRegistry> registry_;
  HawkAuthenticator                        authenticator_;
};

} // namespace fmd::auth
