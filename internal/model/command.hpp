#pragma once

#include <string>

namespace fmd::model {

struct PendingCommand {
  std::string cmd;
  std::string type;
};

} // namespace fmd::model
