#include "reclaim/cleanup/Cleaner.hpp"

#include "reclaim/util/Logger.hpp"

#include <regex>

namespace reclaim::cleanup {

using util::logger;
using util::LogLevel;

bool isValidCharmURL(const std::string& url) {
  static const std::regex re(
    R"(^((cs|ch|local):)?(~[a-z0-9][a-zA-Z0-9+.-]*/)?([a-z][a-z0-9-]*/)?)"
    R"([a-z][a-z0-9]*(-[a-z0-9]*[a-z][a-z0-9]*)*(-[0-9]+)?$)");
  return std::regex_match(url, re);
}

// Remote applications first, so offers consumed here are released before
// the local applications offering them go.
Status Cleaner::cleanupApplicationsForDyingModel(const CleanupTask&, Diagnostics&) {
  auto remotes = _state.aliveRemoteApplications();
  if (!remotes) return annotate(remotes.error(), "reading remote applications");
  for (const auto& app : *remotes) {
    Status st = app->destroy();
    if (st.is(Errc::NotFound)) continue;
    if (!st) return annotate(st, "destroying remote application " + app->name());
  }

  auto apps = _state.aliveApplications();
  if (!apps) return annotate(apps.error(), "reading applications");

  state::DestroyApplicationParams params;
  params.removeOffers = true;
  for (const auto& app : *apps) {
    Status st = app->destroy(params);
    if (st.is(Errc::NotFound)) continue;
    if (!st) return annotate(st, "destroying application " + app->name());
  }
  return {};
}

Status Cleaner::cleanupModelsForDyingController(const CleanupTask& task, Diagnostics&) {
  state::DestroyModelParams legacy;
  legacy.destroyStorage = true;
  const auto params = argsOr(task.args, legacy);

  auto uuids = _state.allModelUUIDs();
  if (!uuids) return uuids.error();

  for (const auto& uuid : *uuids) {
    auto model = _state.model(uuid);
    if (model.is(Errc::NotFound)) continue;
    if (!model) return model.error();

    Status st = (*model)->destroy(params);
    if (st.is(Errc::NotFound)) continue;
    if (!st) return st;
  }
  return {};
}

// Scheduled eagerly; a charm still in use simply stays.
Status Cleaner::cleanupCharm(const CleanupTask& task, Diagnostics&) {
  const std::string& url = task.prefix;
  if (!isValidCharmURL(url)) {
    return makeError(Errc::InvalidArgument, "invalid charm URL " + url);
  }

  auto charm = _state.charm(url);
  if (charm.is(Errc::NotFound)) return {};
  if (!charm) return annotate(charm.error(), "reading charm");

  Status destroyed = (*charm)->destroy();
  if (destroyed.is(Errc::CharmInUse)) {
    logger().log(LogLevel::Debug, "charm still in use", {{"charm", url}});
    return {};
  }
  if (destroyed.is(Errc::NotFound)) return {};
  if (!destroyed) return annotate(destroyed, "destroying charm");

  Status removed = (*charm)->remove();
  if (removed.is(Errc::NotFound)) return {};
  return removed;
}

Status Cleaner::cleanupRelationSettings(const CleanupTask& task, Diagnostics&) {
  return _state.removeRelationSettings(task.prefix);
}

Status Cleaner::cleanupResourceBlob(const CleanupTask& task, Diagnostics&) {
  // Placeholder resources have no blob.
  if (task.prefix.empty()) return {};

  Status st = _state.removeResourceBlob(task.prefix);
  if (st.is(Errc::NotFound)) return {};
  return st;
}

} // namespace reclaim::cleanup
