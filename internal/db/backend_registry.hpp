#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace fmd::db {

/*
  BackendRegistry

  Maps a backend name ("memory", "sqlite", "postgres") to a constructor.
  Populated by the composition root at startup and handed to whoever
  builds the repository; there is no process-wide instance.
*/
class BackendRegistry {
 public:
  using Constructor = std::function<std::shared_ptr<Repository>(const fmd::runtime::config::RuntimeConfig&)>;

  // Replaces any constructor already registered under name.
  void Register(std::string name, Constructor ctor);

  bool Contains(const std::string& name) const;

  // Throws util::Error(Config) for an unknown name.
  std::shared_ptr<Repository> Create(const std::string& name, const fmd::runtime::config::RuntimeConfig& config) const;

  std::vector<std::string> Names() const;

 private:
  std::map<std::string, Constructor> constructors_;
};

} // namespace fmd::db
