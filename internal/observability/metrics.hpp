#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fmd::runtime::config {
class RuntimeConfig;
}

namespace fmd::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"fmd"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const fmd::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Counter / timer sink.

  Same contract as logging: calls never throw and never block on export.
  Without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void Increment(std::string_view name, std::int64_t by = 1);
  void RecordTimer(std::string_view name, double seconds);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const fmd::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::Increment(std::string_view, std::int64_t) {
}

inline void Metrics::RecordTimer(std::string_view, double) {
}
#endif

} // namespace fmd::observability
