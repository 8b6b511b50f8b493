#include "backend_registry.hpp"

#include "internal/util/errors.hpp"

namespace fmd::db {

void BackendRegistry::Register(std::string name, Constructor ctor) {
  constructors_[std::move(name)] = std::move(ctor);
}

bool BackendRegistry::Contains(const std::string& name) const {
  return constructors_.contains(name);
}

std::shared_ptr<Repository> BackendRegistry::Create(const std::string& name, const fmd::runtime::config::RuntimeConfig& config) const {
  auto it = constructors_.find(name);
  if (it == constructors_.end()) {
    std::string known;
    for (const auto& [n, _] : constructors_) {
      if (!known.empty()) known += ",";
      known += n;
    }
    throw util::Error(util::ErrorKind::Config, "unknown database backend '" + name + "' (available: " + known + ")", "create_backend", name);
  }
  return it->second(config);
}

std::vector<std::string> BackendRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(constructors_.size());
  for (const auto& [name, _] : constructors_) names.push_back(name);
  return names;
}

} // namespace fmd::db
