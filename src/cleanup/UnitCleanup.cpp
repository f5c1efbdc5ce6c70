#include "reclaim/cleanup/Cleaner.hpp"

#include "reclaim/util/Logger.hpp"

namespace reclaim::cleanup {

using util::logger;
using util::LogLevel;

// Marks the unit as departing its relations and releases its storage so the
// unit agent can finish. Under force a backstop is scheduled as well.
Status Cleaner::cleanupDyingUnit(const CleanupTask& task, Diagnostics& diag) {
  const auto args = argsOr(task.args, UnitDestroyArgs{});
  const bool force = args.force;
  const std::string& name = task.prefix;

  auto unit = _state.unit(name);
  if (unit.is(Errc::NotFound)) return {};
  if (!unit) return unit.error();

  state::Relations relations;
  auto joined = (*unit)->relationsJoined();
  if (joined) {
    relations = std::move(*joined);
  } else if (Status st = tolerate(force, joined.status(), diag, "getting joined relations for unit " + name); !st) {
    return st;
  }

  for (const auto& relation : relations) {
    auto ru = relation->unit(name);
    if (ru.is(Errc::NotFound)) continue;
    if (!ru) {
      if (Status st = tolerate(force, ru.status(), diag, "getting relation unit in " + relation->key()); !st) return st;
      continue;
    }
    Status st = tolerate(force, (*ru)->prepareLeaveScope(), diag,
                         "preparing to leave scope of " + relation->key());
    if (!st) return st;
  }

  if (force) scheduleForceCleanup(CleanupKind::ForceDestroyedUnit, name);

  if (args.destroyStorage) return unitStorageInstances(name, force);
  return unitStorageAttachments(name, false, force, diag);
}

// Backstop for a forced unit destroy that the agents never completed.
Status Cleaner::cleanupForceDestroyedUnit(const CleanupTask& task, Diagnostics& diag) {
  const std::string& name = task.prefix;

  auto unit = _state.unit(name);
  if (unit.is(Errc::NotFound)) {
    logger().log(LogLevel::Debug, "no need to force unit to dead", {{"unit", name}});
    return {};
  }
  if (!unit) return unit.error();

  for (const auto& subName : (*unit)->subordinateNames()) {
    auto sub = _state.unit(subName);
    if (sub.is(Errc::NotFound)) continue;
    if (!sub) {
      warn(sub.status(), diag, "getting subordinate " + subName + " to force destroy");
      continue;
    }
    Forced r = (*sub)->destroyWithForce(true);
    diag.merge(r.diagnostics);
    warn(r.status, diag, "destroying subordinate " + subName);
  }

  auto inScope = (*unit)->relationsInScope();
  if (inScope) {
    for (const auto& relation : *inScope) {
      auto ru = relation->unit(name);
      if (!ru) {
        warn(ru.status(), diag, "getting relation unit for " + name + " in " + relation->key());
        continue;
      }
      warn((*ru)->leaveScope(), diag, "unit " + name + " leaving scope of " + relation->key());
    }
  } else {
    warn(inScope.status(), diag, "getting in-scope relations for unit " + name);
  }

  warn(forceRemoveUnitStorageAttachments(name, diag), diag, "removing storage attachments for " + name);

  Status dead = (*unit)->ensureDead();
  if (dead.is(Errc::HasSubordinates) || dead.is(Errc::HasStorageAttachments)) {
    // Retried until the dependents have gone.
    return dead;
  }
  warn(dead, diag, "setting unit " + name + " dead");

  scheduleForceCleanup(CleanupKind::ForceRemoveUnit, name);
  return {};
}

Status Cleaner::cleanupForceRemoveUnit(const CleanupTask& task, Diagnostics& diag) {
  auto unit = _state.unit(task.prefix);
  if (unit.is(Errc::NotFound)) {
    logger().log(LogLevel::Debug, "no need to force remove unit", {{"unit", task.prefix}});
    return {};
  }
  if (!unit) return unit.error();

  Forced r = (*unit)->removeWithForce(true);
  if (!r.diagnostics.empty()) {
    logger().log(LogLevel::Warn, "errors encountered force-removing unit",
                 {{"unit", task.prefix}, {"errors", r.diagnostics.describe()}});
    diag.merge(r.diagnostics);
  }
  return r.status;
}

Status Cleaner::cleanupUnitsForDyingApplication(const CleanupTask& task, Diagnostics&) {
  const auto args = argsOr(task.args, UnitDestroyArgs{});

  auto units = _state.aliveUnits(task.prefix);
  if (!units) return annotate(units.error(), "reading units of " + task.prefix);

  state::DestroyUnitParams params;
  params.destroyStorage = args.destroyStorage;
  params.force = args.force;
  for (const auto& u : *units) {
    Status st = u->destroy(params);
    if (st.is(Errc::NotFound)) continue;
    if (!st) return st;
  }
  return {};
}

// Final bookkeeping once a unit is gone: its pending actions and payloads.
Status Cleaner::cleanupRemovedUnit(const CleanupTask& task, Diagnostics& diag) {
  const bool force = argsOr(task.args, ForceArgs{}).force;
  const std::string& name = task.prefix;

  std::vector<std::shared_ptr<state::Action>> actions;
  auto found = _state.unitActions(name);
  if (found) {
    actions = std::move(*found);
  } else if (Status st = tolerate(force, found.status(), diag, "getting actions for unit " + name); !st) {
    return st;
  }

  state::ActionResults cancelled;
  cancelled.status = state::ActionStatus::Cancelled;
  cancelled.message = "unit removed";

  for (const auto& action : actions) {
    switch (action->status()) {
      case state::ActionStatus::Completed:
      case state::ActionStatus::Cancelled:
      case state::ActionStatus::Failed:
        break;
      default: {
        Status st = tolerate(force, action->finish(cancelled), diag,
                             "finishing action " + action->name() + " for unit " + name);
        if (!st) return st;
      }
    }
  }

  return tolerate(force, _state.removeUnitPayloads(name), diag, "removing payloads for unit " + name);
}

Status Cleaner::cleanupDyingUnitResources(const CleanupTask& task, Diagnostics& diag) {
  const bool force = argsOr(task.args, ForceArgs{}).force;
  const auto host = state::Tag::unit(task.prefix);

  std::vector<state::FilesystemAttachment> filesystems;
  auto fsa = _storage.filesystemAttachments(host);
  if (fsa) {
    filesystems = std::move(*fsa);
  } else if (Status st = tolerate(force, fsa.status(), diag, "getting unit filesystem attachments"); !st) {
    return st;
  }

  std::vector<state::VolumeAttachment> volumes;
  auto va = _storage.volumeAttachments(host);
  if (va) {
    volumes = std::move(*va);
  } else if (Status st = tolerate(force, va.status(), diag, "getting unit volume attachments"); !st) {
    return st;
  }

  return dyingEntityStorage(host, false, filesystems, volumes, force, diag);
}

Status Cleaner::unitStorageAttachments(const std::string& unit, bool remove, bool force, Diagnostics& diag) {
  auto attachments = _storage.unitStorageAttachments(unit);
  if (!attachments) return attachments.error();

  for (const auto& a : *attachments) {
    Status st = _storage.detachStorage(a.storageId, unit, force);
    if (st.is(Errc::NotFound)) continue;
    if (Status t = tolerate(force, st, diag, "detaching storage " + a.storageId + " for unit " + unit); !t) return t;
    if (!remove) continue;

    st = _storage.removeStorageAttachment(a.storageId, unit, force);
    if (st.is(Errc::NotFound)) continue;
    if (Status t = tolerate(force, st, diag, "removing storage attachment " + a.storageId + " for unit " + unit); !t) return t;
  }
  return {};
}

Status Cleaner::unitStorageInstances(const std::string& unit, bool force) {
  auto attachments = _storage.unitStorageAttachments(unit);
  if (!attachments) return attachments.error();

  for (const auto& a : *attachments) {
    Status st = _storage.destroyStorageInstance(a.storageId, true, force);
    if (st.is(Errc::NotFound)) continue;
    if (!st) return st;
  }
  return {};
}

Status Cleaner::forceRemoveUnitStorageAttachments(const std::string& unit, Diagnostics& diag) {
  Status st = _storage.destroyUnitStorageAttachments(unit);
  if (!st && !st.is(Errc::NotFound)) return annotate(st, "destroying storage attachments for " + unit);

  auto attachments = _storage.unitStorageAttachments(unit);
  if (!attachments) return annotate(attachments.error(), "getting storage attachments for " + unit);

  for (const auto& a : *attachments) {
    warn(_storage.removeStorageAttachment(a.storageId, unit, true), diag,
         "removing storage attachment " + a.storageId + " for " + unit);
  }
  return {};
}

// Removes a unit and its subordinates outright. Only used while a machine
// is being force-destroyed, where no agent is left to shut the unit down.
Status Cleaner::obliterateUnit(const std::string& name, bool force, Diagnostics& diag) {
  auto found = _state.unit(name);
  if (found.is(Errc::NotFound)) return {};
  if (!found) return found.error();
  auto& unit = *found;

  Forced destroyed = unit->destroyWithForce(force);
  diag.merge(destroyed.diagnostics);
  if (Status st = tolerate(force, destroyed.status, diag, "cannot destroy unit " + name); !st) return st;

  Status refreshed = unit->refresh();
  if (refreshed.is(Errc::NotFound)) return {};
  if (Status st = tolerate(force, refreshed, diag, "refreshing unit " + name); !st) return st;

  Status st = tolerate(force, unitStorageAttachments(name, true, force, diag), diag,
                       "cannot destroy storage for unit " + name);
  if (!st) return st;

  for (const auto& sub : unit->subordinateNames()) {
    if (Status s = tolerate(force, obliterateUnit(sub, force, diag), diag, "obliterating " + sub); !s) return s;
  }

  if (Status s = tolerate(force, unit->ensureDead(), diag, "setting unit " + name + " dead"); !s) return s;

  Forced removed = unit->removeWithForce(force);
  diag.merge(removed.diagnostics);
  if (removed.status.is(Errc::NotFound)) return {};
  return removed.status;
}

} // namespace reclaim::cleanup
