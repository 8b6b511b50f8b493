#include "db_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fmd::service {

void ThrowIfDbError(const fmd::db::Result& result, const std::string& operation, const std::string& key) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? operation : operation + ": " + result.message;
  FMD_LOG_ERROR("db", "storage operation failed",
                {observability::StringField("operation", operation), observability::StringField("key", key),
                 observability::StringField("code", fmd::db::ToString(result.code)), observability::StringField("error", result.message)});

  switch (result.code) {
    case fmd::db::ErrorCode::Busy:
    case fmd::db::ErrorCode::Timeout:
      throw util::Error(util::ErrorKind::Timeout, message, operation, key);
    default:
      throw util::Error(util::ErrorKind::Storage, message, operation, key);
  }
}

} // namespace fmd::service
