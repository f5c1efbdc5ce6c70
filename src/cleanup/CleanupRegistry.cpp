#include "reclaim/cleanup/CleanupRegistry.hpp"

#include <utility>

namespace reclaim::cleanup {

void CleanupRegistry::registerHandler(CleanupKind kind, Handler fn) {
  _handlers[indexOf(kind)] = std::move(fn);
}

const CleanupRegistry::Handler* CleanupRegistry::find(CleanupKind kind) const {
  const auto i = indexOf(kind);
  if (i >= _handlers.size() || !_handlers[i]) return nullptr;
  return &_handlers[i];
}

std::vector<CleanupKind> CleanupRegistry::registeredKinds() const {
  std::vector<CleanupKind> v;
  v.reserve(kCleanupKindCount);
  for (CleanupKind k : allCleanupKinds()) {
    if (_handlers[indexOf(k)]) v.push_back(k);
  }
  return v;
}

} // namespace reclaim::cleanup
