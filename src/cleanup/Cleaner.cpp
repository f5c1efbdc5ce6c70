#include "reclaim/cleanup/Cleaner.hpp"

#include "reclaim/util/Config.hpp"
#include "reclaim/util/Logger.hpp"
#include "reclaim/util/Metrics.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace reclaim::cleanup {

using util::logger;
using util::LogLevel;

namespace {

// now + delay, pinned to the clock's range.
TimePoint deadlineAfter(TimePoint now, std::chrono::milliseconds delay) {
  using std::chrono::milliseconds;
  const auto d = std::chrono::duration_cast<TimePoint::duration>(
      std::clamp(delay,
                 std::chrono::duration_cast<milliseconds>(TimePoint::duration::min()),
                 std::chrono::duration_cast<milliseconds>(TimePoint::duration::max())));
  if (d.count() >= 0 && now > TimePoint::max() - d) return TimePoint::max();
  if (d.count() < 0 && now < TimePoint::min() - d) return TimePoint::min();
  return now + d;
}

} // namespace

CleanupOptions CleanupOptions::fromConfig(const util::Config& cfg) {
  CleanupOptions o;
  o.forceTimeout      = std::chrono::milliseconds(cfg.forceTimeoutMs);
  o.maxContainerDepth = cfg.maxContainerDepth;
  o.modelUUID         = cfg.modelUUID;
  return o;
}

Cleaner::Cleaner(state::EntityState& st,
                 state::StorageBackend& sb,
                 TaskStore& tasks,
                 const util::Clock& clock,
                 CleanupOptions options)
  : _state(st)
  , _storage(sb)
  , _tasks(tasks)
  , _clock(clock)
  , _options(std::move(options)) {
  registerHandlers();
}

void Cleaner::registerHandlers() {
  using Fn = Status (Cleaner::*)(const CleanupTask&, Diagnostics&);
  auto bind = [this](Fn fn) -> CleanupRegistry::Handler {
    return [this, fn](const CleanupTask& t, Diagnostics& d) { return (this->*fn)(t, d); };
  };

  _registry.registerHandler(CleanupKind::RelationSettings,              bind(&Cleaner::cleanupRelationSettings));
  _registry.registerHandler(CleanupKind::UnitsForDyingApplication,      bind(&Cleaner::cleanupUnitsForDyingApplication));
  _registry.registerHandler(CleanupKind::Charm,                         bind(&Cleaner::cleanupCharm));
  _registry.registerHandler(CleanupKind::DyingUnit,                     bind(&Cleaner::cleanupDyingUnit));
  _registry.registerHandler(CleanupKind::ForceDestroyedUnit,            bind(&Cleaner::cleanupForceDestroyedUnit));
  _registry.registerHandler(CleanupKind::ForceRemoveUnit,               bind(&Cleaner::cleanupForceRemoveUnit));
  _registry.registerHandler(CleanupKind::RemovedUnit,                   bind(&Cleaner::cleanupRemovedUnit));
  _registry.registerHandler(CleanupKind::ApplicationsForDyingModel,     bind(&Cleaner::cleanupApplicationsForDyingModel));
  _registry.registerHandler(CleanupKind::DyingMachine,                  bind(&Cleaner::cleanupDyingMachine));
  _registry.registerHandler(CleanupKind::ForceDestroyedMachine,         bind(&Cleaner::cleanupForceDestroyedMachine));
  _registry.registerHandler(CleanupKind::AttachmentsForDyingStorage,    bind(&Cleaner::cleanupAttachmentsForDyingStorage));
  _registry.registerHandler(CleanupKind::AttachmentsForDyingVolume,     bind(&Cleaner::cleanupAttachmentsForDyingVolume));
  _registry.registerHandler(CleanupKind::AttachmentsForDyingFilesystem, bind(&Cleaner::cleanupAttachmentsForDyingFilesystem));
  _registry.registerHandler(CleanupKind::ModelsForDyingController,      bind(&Cleaner::cleanupModelsForDyingController));
  _registry.registerHandler(CleanupKind::MachinesForDyingModel,         bind(&Cleaner::cleanupMachinesForDyingModel));
  _registry.registerHandler(CleanupKind::DyingUnitResources,            bind(&Cleaner::cleanupDyingUnitResources));
  _registry.registerHandler(CleanupKind::ResourceBlob,                  bind(&Cleaner::cleanupResourceBlob));
  _registry.registerHandler(CleanupKind::StorageForDyingModel,          bind(&Cleaner::cleanupStorageForDyingModel));
}

Status Cleaner::enqueueCleanup(CleanupKind kind, const std::string& prefix, std::vector<RawArg> args) {
  return _tasks.enqueue(kind, prefix, std::move(args));
}

Result<bool> Cleaner::hasPendingCleanups() const {
  return _tasks.hasPending();
}

Status Cleaner::runCleanup(CleanupReport* report) {
  std::vector<util::Field> ctx;
  if (!_options.modelUUID.empty()) ctx.push_back({"model", _options.modelUUID});
  util::Logger::Scoped scope(ctx);

  RECLAIM_METRIC_HIT("cleanup.pass");

  auto due = _tasks.due(_clock.now());
  if (!due) return annotate(due.error(), "reading cleanup document");

  for (const auto& doc : *due) {
    TaskOutcome outcome;
    outcome.id     = doc.id;
    outcome.kind   = doc.kind;
    outcome.prefix = doc.prefix;

    logger().log(LogLevel::Debug, "cleanup.run", {{"kind", doc.kind}, {"prefix", doc.prefix}});

    auto task = decodeTask(doc);
    if (!task) {
      RECLAIM_METRIC_HIT("cleanup.undecodable");
      outcome.status = task.error();
    } else {
      outcome.status = dispatch(*task, outcome.diagnostics);
    }

    if (report) ++report->processed;

    if (!outcome.status) {
      RECLAIM_METRIC_HIT("cleanup.failed");
      logger().log(LogLevel::Warn, "cleanup.failed",
                   {{"kind", doc.kind}, {"prefix", doc.prefix}, {"error", outcome.status.describe()}});
      if (report) {
        ++report->failed;
        report->outcomes.push_back(std::move(outcome));
      }
      continue;
    }

    Status removed = _tasks.remove(doc.id);
    if (!removed) return annotate(removed, "cannot remove empty cleanup document");

    RECLAIM_METRIC_HIT("cleanup.ok");
    if (report) {
      ++report->succeeded;
      report->outcomes.push_back(std::move(outcome));
    }
  }

  if (auto n = _tasks.pendingCount()) {
    RECLAIM_METRIC_SET("cleanup.pending", static_cast<double>(*n));
  }
  return {};
}

Status Cleaner::dispatch(const CleanupTask& task, Diagnostics& diag) const {
  const auto* handler = _registry.find(task.kind);
  if (!handler) {
    return makeError(Errc::UnknownKind,
                     std::string("no handler for cleanup kind \"") + toString(task.kind) + "\"",
                     task.prefix);
  }
  try {
    return (*handler)(task, diag);
  } catch (const std::exception& e) {
    return makeError(Errc::Internal, std::string("cleanup handler threw: ") + e.what(), task.prefix);
  }
}

void Cleaner::scheduleForceCleanup(CleanupKind kind, const std::string& name) {
  const TimePoint deadline = deadlineAfter(_clock.now(), _options.forceTimeout);
  Status st = _tasks.database().run([&](int) -> Result<std::vector<store::TxnOp>> {
    return std::vector<store::TxnOp>{newCleanupAtOp(deadline, kind, name)};
  });
  if (!st) {
    logger().log(LogLevel::Warn, "cleanup.schedule_failed",
                 {{"kind", toString(kind)}, {"prefix", name}, {"error", st.describe()}});
    return;
  }
  RECLAIM_METRIC_HIT("cleanup.scheduled");
}

Status Cleaner::tolerate(bool force, const Status& st, Diagnostics& diag, const std::string& context) {
  if (st) return st;
  if (!force) return annotate(st, context);
  warn(st, diag, context);
  return {};
}

void Cleaner::warn(const Status& st, Diagnostics& diag, const std::string& context) {
  if (st) return;
  Status annotated = annotate(st, context);
  logger().log(LogLevel::Warn, "cleanup.forced", {{"error", annotated.describe()}});
  RECLAIM_METRIC_HIT("cleanup.forced_warnings");
  diag.add(annotated);
}

} // namespace reclaim::cleanup
