#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using fmd::auth::RequestInfo;
using fmd::runtime::config::RuntimeConfig;
using fmd::util::Error;
using fmd::util::ErrorKind;

constexpr const char* kBody = "{\"op\":\"lock\"}";

fmd::factory::Application NewApp() {
  RuntimeConfig config;
  config.mutable_database()->set_backend("memory");
  config.mutable_hawk()->set_override_port(true);
  config.mutable_gc()->set_interval_sec(1);
  return fmd::factory::Build(config);
}

RequestInfo CommandRequest() {
  RequestInfo r;
  r.method       = "POST";
  r.scheme       = "https";
  r.host         = "fmd.example.com:8443";
  r.path         = "/cmd";
  r.content_type = "application/json";
  return r;
}

template <typename Fn>
ErrorKind ExpectError(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.kind();
  }
  assert(false && "expected fmd::util::Error");
  return ErrorKind::Storage;
}

void RegisterPhone(fmd::factory::Application& app) {
  fmd::model::Device phone;
  phone.id          = "dev-1";
  phone.name        = "Phone";
  phone.hawk_secret = "s3cr3t";
  app.devices->Register("user-1", phone);
}

void TestSignedCommandIsAcceptedOnce() {
  auto app = NewApp();
  RegisterPhone(app);

  const auto nonce = app.nonces->Issue();

  // the device signs with the server nonce in ext
  auto request          = CommandRequest();
  request.authorization = app.hawk->AsHeader(request, "dev-1", kBody, nonce, "s3cr3t");

  const auto device = app.auth_guard->Authenticate(request, kBody);
  assert(device.id == "dev-1");
  assert(device.user_id == "user-1");

  const auto claimed = app.hawk->Parse(request);
  assert(claimed.ext == nonce);
  assert(app.nonces->VerifyAndConsume(claimed.ext));

  app.commands->StoreCommand(device.id, kBody, "lock");
  auto pending = app.commands->GetPending("dev-1");
  assert(pending.has_value());
  assert(pending->cmd == kBody);

  // replay: MAC still verifies, nonce does not
  (void)app.auth_guard->Authenticate(request, kBody);
  assert(!app.nonces->VerifyAndConsume(claimed.ext));
}

void TestRejections() {
  auto app = NewApp();
  RegisterPhone(app);

  auto request = CommandRequest();
  assert(ExpectError([&] { app.auth_guard->Authenticate(request, kBody); }) == ErrorKind::NoAuth);

  request.authorization = "Bearer abc";
  assert(ExpectError([&] { app.auth_guard->Authenticate(request, kBody); }) == ErrorKind::NotHawkAuth);

  request.authorization = app.hawk->AsHeader(request, "dev-2", kBody, "", "s3cr3t");
  assert(ExpectError([&] { app.auth_guard->Authenticate(request, kBody); }) == ErrorKind::UnknownDevice);

  request.authorization = app.hawk->AsHeader(request, "dev-1", kBody, "", "wrong");
  assert(ExpectError([&] { app.auth_guard->Authenticate(request, kBody); }) == ErrorKind::InvalidSignature);

  request.authorization = app.hawk->AsHeader(request, "dev-1", kBody, "", "s3cr3t");
  assert(ExpectError([&] { app.auth_guard->Authenticate(request, "{\"op\":\"wipe\"}"); }) == ErrorKind::InvalidSignature);
}

void TestPortOverrideBehindProxy() {
  auto app = NewApp();
  RegisterPhone(app);

  // signed for the public port, received on the proxy's port
  auto signed_for        = CommandRequest();
  signed_for.host        = "fmd.example.com";
  const auto header      = app.hawk->AsHeader(signed_for, "dev-1", kBody, "", "s3cr3t");
  auto       received    = CommandRequest();
  received.authorization = header;

  assert(app.auth_guard->Authenticate(received, kBody).id == "dev-1");
}

void TestLocationRoundTripAndGc() {
  auto app = NewApp();
  RegisterPhone(app);

  app.positions->SetDeviceLocation("dev-1", {48.0, 11.0, 500.0, 5.0, 0});
  assert(app.positions->GetPositions("dev-1").size() == 1);

  fmd::db::model::PositionRecord stale;
  stale.device_id = "dev-9";
  stale.time_ms   = fmd::util::NowMillis() - 10LL * 24 * 3600 * 1000;
  {
    auto tx = app.repository->Begin();
    assert(app.repository->InsertPosition(*tx, stale));
    tx->Commit();
  }

  app.gc_worker->RunOnce();
  assert(app.positions->GetPositions("dev-9").empty());
  assert(app.positions->GetPositions("dev-1").size() == 1);
}

void TestGcWorkerStartsAndStops() {
  auto app = NewApp();
  app.gc_worker->Start();
  app.gc_worker->Start();
  app.gc_worker->Stop();
  app.gc_worker->Stop();
}

void TestDeleteDeviceThenAuthFails() {
  auto app = NewApp();
  RegisterPhone(app);

  auto request          = CommandRequest();
  request.authorization = app.hawk->AsHeader(request, "dev-1", kBody, "", "s3cr3t");
  (void)app.auth_guard->Authenticate(request, kBody);

  app.devices->DeleteDevice("dev-1");
  assert(ExpectError([&] { app.auth_guard->Authenticate(request, kBody); }) == ErrorKind::UnknownDevice);
}

} // namespace

int main() {
  TestSignedCommandIsAcceptedOnce();
  TestRejections();
  TestPortOverrideBehindProxy();
  TestLocationRoundTripAndGc();
  TestGcWorkerStartsAndStops();
  TestDeleteDeviceThenAuthFails();

  std::cout << "fmd_unit_end_to_end: pass\n";
  return 0;
}
