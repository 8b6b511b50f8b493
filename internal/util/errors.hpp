#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fmd::util {

/*
  Central error type.

  Every failure the core surfaces is one of these kinds. Protocol kinds
  (NoAuth .. NonceInvalid) are caller faults and terminal for the request;
  Storage and Timeout originate in the backing store and are never retried
  here because commands and nonces are single use.
*/

enum class ErrorKind {
  NoAuth,
  NotHawkAuth,
  InvalidSignature,
  UnknownDevice,
  NonceInvalid,
  Storage,
  Timeout,
  Config,
};

inline std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NoAuth:
      return "no_auth";
    case ErrorKind::NotHawkAuth:
      return "not_hawk_auth";
    case ErrorKind::InvalidSignature:
      return "invalid_signature";
    case ErrorKind::UnknownDevice:
      return "unknown_device";
    case ErrorKind::NonceInvalid:
      return "nonce_invalid";
    case ErrorKind::Storage:
      return "storage";
    case ErrorKind::Timeout:
      return "timeout";
    case ErrorKind::Config:
      return "config";
  }
  return "unknown";
}

inline bool IsProtocolError(ErrorKind kind) {
  return kind == ErrorKind::NoAuth || kind == ErrorKind::NotHawkAuth || kind == ErrorKind::InvalidSignature ||
         kind == ErrorKind::NonceInvalid;
}

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg, std::string operation = {}, std::string key = {})
      : std::runtime_error(msg), kind_(kind), operation_(std::move(operation)), key_(std::move(key)) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

  // Storage operation that failed, e.g. "store_command".
  const std::string& operation() const noexcept {
    return operation_;
  }

  // Primary key the operation was working on (device id, nonce key, ...).
  const std::string& key() const noexcept {
    return key_;
  }

 private:
  ErrorKind   kind_;
  std::string operation_;
  std::string key_;
};

} // namespace fmd::util
