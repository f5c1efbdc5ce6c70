#pragma once

#include "reclaim/Result.hpp"
#include "reclaim/cleanup/CleanupKind.hpp"

#include <array>
#include <functional>
#include <vector>

namespace reclaim::cleanup {

struct CleanupTask;

// Kind -> handler table. Filled once when the owning Cleaner is built and
// read-only afterwards.
class CleanupRegistry {
public:
  using Handler = std::function<Status(const CleanupTask&, Diagnostics&)>;

  /// Installs `fn` for `kind`, replacing any previous handler.
  void registerHandler(CleanupKind kind, Handler fn);

  /// nullptr when nothing is registered for `kind`.
  const Handler* find(CleanupKind kind) const;

  std::vector<CleanupKind> registeredKinds() const;

private:
  std::array<Handler, kCleanupKindCount> _handlers;
};

} // namespace reclaim::cleanup
