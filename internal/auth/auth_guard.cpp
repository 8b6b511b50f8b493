#include "auth_guard.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/service/device_registry.hpp"
#include "internal/util/errors.hpp"

namespace fmd::auth {

using observability::StringField;

AuthGuard::AuthGuard(std::shared_ptr<service::DeviceRegistry> registry, HawkAuthenticator authenticator)
    : registry_(std::move(registry)), authenticator_(authenticator) {
}

model::Device AuthGuard::Authenticate(const RequestInfo& request, std::string_view body) const {
  try {
    const auto claimed = authenticator_.Parse(request);
    auto       device  = registry_->GetDeviceInfo(claimed.id);
    authenticator_.Verify(request, claimed, body, device.hawk_secret);
    return device;
  } catch (const util::Error& e) {
    if (util::IsProtocolError(e.kind()) || e.kind() == util::ErrorKind::UnknownDevice) {
      observability::Metrics::Instance().Increment("auth.rejected");
      FMD_LOG_WARN("auth", "request rejected",
                   {StringField("reason", util::ToString(e.kind())), StringField("path", request.path), StringField("device_id", e.key())});
    }
    throw;
  }
}

} // namespace fmd::auth
