#pragma once

#include "reclaim/Result.hpp"
#include "reclaim/cleanup/CleanupArgs.hpp"
#include "reclaim/cleanup/CleanupKind.hpp"
#include "reclaim/cleanup/CleanupRegistry.hpp"
#include "reclaim/cleanup/TaskStore.hpp"
#include "reclaim/state/EntityState.hpp"
#include "reclaim/state/Storage.hpp"
#include "reclaim/util/Clock.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace reclaim {
namespace util { class Config; }

namespace cleanup {

struct CleanupOptions {
  // Delay before a force backstop task becomes eligible.
  std::chrono::milliseconds forceTimeout{60000};
  // Deepest machine -> container nesting a forced machine teardown walks.
  int maxContainerDepth = 32;
  std::string modelUUID;

  static CleanupOptions fromConfig(const util::Config& cfg);
};

struct TaskOutcome {
  std::string id;
  std::string kind;       // as persisted, may be unknown to this build
  std::string prefix;
  Status status;
  Diagnostics diagnostics;
};

struct CleanupReport {
  std::size_t processed = 0;
  std::size_t succeeded = 0;
  std::size_t failed    = 0;
  std::vector<TaskOutcome> outcomes;
};

/**
 * Drains due cleanup tasks and runs the teardown step each one names.
 *
 * Handlers are idempotent: an entity that is already gone counts as done,
 * and a failing handler leaves its task in place for the next pass.
 */
class Cleaner {
public:
  Cleaner(state::EntityState& st,
          state::StorageBackend& sb,
          TaskStore& tasks,
          const util::Clock& clock,
          CleanupOptions options = {});

  Cleaner(const Cleaner&)            = delete;
  Cleaner& operator=(const Cleaner&) = delete;

  Status enqueueCleanup(CleanupKind kind, const std::string& prefix, std::vector<RawArg> args = {});
  Result<bool> hasPendingCleanups() const;

  /// One pass over the due tasks. Only store failures are returned; handler
  /// errors are logged and, when `report` is given, recorded there.
  Status runCleanup(CleanupReport* report = nullptr);

  const CleanupOptions& options() const { return _options; }
  const CleanupRegistry& registry() const { return _registry; }

private:
  void registerHandlers();
  Status dispatch(const CleanupTask& task, Diagnostics& diag) const;

  // Enqueues `kind` for `name` at now + forceTimeout. Failure is only logged.
  void scheduleForceCleanup(CleanupKind kind, const std::string& name);

  // Under force a failure becomes a warning in `diag` and ok is returned;
  // otherwise the annotated failure is returned. Ok passes through.
  static Status tolerate(bool force, const Status& st, Diagnostics& diag, const std::string& context);
  static void warn(const Status& st, Diagnostics& diag, const std::string& context);

  // units
  Status cleanupDyingUnit(const CleanupTask& task, Diagnostics& diag);
  Status cleanupForceDestroyedUnit(const CleanupTask& task, Diagnostics& diag);
  Status cleanupForceRemoveUnit(const CleanupTask& task, Diagnostics& diag);
  Status cleanupUnitsForDyingApplication(const CleanupTask& task, Diagnostics& diag);
  Status cleanupRemovedUnit(const CleanupTask& task, Diagnostics& diag);
  Status cleanupDyingUnitResources(const CleanupTask& task, Diagnostics& diag);

  Status unitStorageAttachments(const std::string& unit, bool remove, bool force, Diagnostics& diag);
  Status unitStorageInstances(const std::string& unit, bool force);
  Status forceRemoveUnitStorageAttachments(const std::string& unit, Diagnostics& diag);
  Status obliterateUnit(const std::string& name, bool force, Diagnostics& diag);

  // machines
  Status cleanupDyingMachine(const CleanupTask& task, Diagnostics& diag);
  Status cleanupForceDestroyedMachine(const CleanupTask& task, Diagnostics& diag);
  Status cleanupMachinesForDyingModel(const CleanupTask& task, Diagnostics& diag);

  Status teardownMachine(state::Machine& machine, Diagnostics& diag);
  Status revokeVote(state::Machine& machine);
  Status dyingMachineResources(state::Machine& machine, bool force, Diagnostics& diag);

  // storage
  Status cleanupAttachmentsForDyingStorage(const CleanupTask& task, Diagnostics& diag);
  Status cleanupAttachmentsForDyingVolume(const CleanupTask& task, Diagnostics& diag);
  Status cleanupAttachmentsForDyingFilesystem(const CleanupTask& task, Diagnostics& diag);
  Status cleanupStorageForDyingModel(const CleanupTask& task, Diagnostics& diag);

  Status dyingEntityStorage(const state::Tag& host, bool manual,
                            const std::vector<state::FilesystemAttachment>& filesystemAttachments,
                            const std::vector<state::VolumeAttachment>& volumeAttachments,
                            bool force, Diagnostics& diag);

  // model-wide and records
  Status cleanupApplicationsForDyingModel(const CleanupTask& task, Diagnostics& diag);
  Status cleanupModelsForDyingController(const CleanupTask& task, Diagnostics& diag);
  Status cleanupCharm(const CleanupTask& task, Diagnostics& diag);
  Status cleanupRelationSettings(const CleanupTask& task, Diagnostics& diag);
  Status cleanupResourceBlob(const CleanupTask& task, Diagnostics& diag);

private:
  state::EntityState&    _state;
  state::StorageBackend& _storage;
  TaskStore&             _tasks;
  const util::Clock&     _clock;
  CleanupOptions         _options;
  CleanupRegistry        _registry;
};

/// Accepts `[schema:][~user/][series/]name[-revision]` charm URLs.
bool isValidCharmURL(const std::string& url);

} // namespace cleanup
} // namespace reclaim
