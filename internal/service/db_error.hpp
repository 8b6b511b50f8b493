#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace fmd::service {

// Logs and throws util::Error for a failed write: Busy/Timeout -> Timeout,
// anything else -> Storage. No-op for an OK result.
void ThrowIfDbError(const fmd::db::Result& result, const std::string& operation, const std::string& key);

} // namespace fmd::service
