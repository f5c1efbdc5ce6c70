#include "reclaim/cleanup/Cleaner.hpp"

#include "reclaim/store/Database.hpp"
#include "reclaim/util/Logger.hpp"

#include <set>
#include <string>
#include <vector>

namespace reclaim::cleanup {

using util::logger;
using util::LogLevel;

Status Cleaner::cleanupDyingMachine(const CleanupTask& task, Diagnostics& diag) {
  const bool force = argsOr(task.args, ForceArgs{}).force;

  auto machine = _state.machine(task.prefix);
  if (machine.is(Errc::NotFound)) return {};
  if (!machine) return machine.error();

  return dyingMachineResources(**machine, force, diag);
}

// Tears down everything that depends on the machine and its containers,
// removing the containers themselves. The machine record is left for the
// provisioner.
Status Cleaner::cleanupForceDestroyedMachine(const CleanupTask& task, Diagnostics& diag) {
  struct Visit {
    std::shared_ptr<state::Machine> machine;
    int depth = 0;
    bool container = false;
  };

  auto root = _state.machine(task.prefix);
  if (root.is(Errc::NotFound)) return {};
  if (!root) return root.error();

  // Parents land in `order` before any of their containers.
  std::vector<Visit> order;
  std::vector<Visit> pending{Visit{*root, 0, false}};
  std::set<std::string> visited{task.prefix};

  while (!pending.empty()) {
    Visit v = std::move(pending.back());
    pending.pop_back();

    logger().log(LogLevel::Info, "removing any upgrade series locks", {{"machine", v.machine->id()}});
    Status lock = v.machine->removeUpgradeSeriesLock();
    if (!lock && !lock.is(Errc::NotFound)) return lock;

    auto containers = v.machine->containers();
    if (!containers && !containers.is(Errc::NotFound)) return containers.error();
    if (containers) {
      for (const auto& id : *containers) {
        if (!visited.insert(id).second) {
          return makeError(Errc::Internal, "container cycle through machine " + id, task.prefix);
        }
        if (v.depth + 1 > _options.maxContainerDepth) {
          return makeError(Errc::Internal,
                           "containers nested deeper than " + std::to_string(_options.maxContainerDepth),
                           task.prefix);
        }
        auto c = _state.machine(id);
        if (c.is(Errc::NotFound)) continue;
        if (!c) return c.error();
        pending.push_back(Visit{*c, v.depth + 1, true});
      }
    }
    order.push_back(std::move(v));
  }

  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    if (Status st = teardownMachine(*it->machine, diag); !st) return st;
    if (!it->container) continue;

    auto c = _state.machine(it->machine->id());
    if (c.is(Errc::NotFound)) continue;
    if (!c) return c.error();
    Status st = (*c)->remove();
    if (!st && !st.is(Errc::NotFound)) return st;
  }
  return {};
}

Status Cleaner::teardownMachine(state::Machine& machine, Diagnostics& diag) {
  for (const auto& unitName : machine.principals()) {
    if (Status st = obliterateUnit(unitName, true, diag); !st) return st;
  }

  if (Status st = dyingMachineResources(machine, true, diag); !st) return st;

  if (machine.isManager()) {
    if (machine.hasVote()) {
      if (Status st = revokeVote(machine); !st) return st;
    }
    if (Status st = _state.removeControllerMachine(machine); !st && !st.is(Errc::NotFound)) return st;
  }

  // Unit teardown above changed the machine underneath our copy.
  Status refreshed = machine.refresh();
  if (refreshed.is(Errc::NotFound)) return {};
  if (!refreshed) return refreshed;

  if (Status st = machine.ensureDead(); !st) return st;

  Status ports = machine.removeOpenedPorts();
  if (!ports && !ports.is(Errc::NotFound)) return ports;
  return {};
}

Status Cleaner::revokeVote(state::Machine& machine) {
  for (int attempt = 0; attempt < store::Database::kDefaultAttempts; ++attempt) {
    if (attempt != 0) {
      if (Status st = machine.refresh(); !st) return st;
      if (!machine.hasVote()) return {};
    }
    Status st = machine.setHasVote(false);
    if (!st.is(Errc::TxnAborted)) return st;
  }
  return makeError(Errc::TxnAborted, "cannot revoke vote: state changing too quickly", machine.id());
}

Status Cleaner::dyingMachineResources(state::Machine& machine, bool force, Diagnostics& diag) {
  const auto host = state::Tag::machine(machine.id());

  std::vector<state::FilesystemAttachment> filesystems;
  auto fsa = _storage.filesystemAttachments(host);
  if (fsa) {
    filesystems = std::move(*fsa);
  } else if (Status st = tolerate(force, fsa.status(), diag, "getting machine filesystem attachments"); !st) {
    return st;
  }

  std::vector<state::VolumeAttachment> volumes;
  auto va = _storage.volumeAttachments(host);
  if (va) {
    volumes = std::move(*va);
  } else if (Status st = tolerate(force, va.status(), diag, "getting machine volume attachments"); !st) {
    return st;
  }

  // Manual machines keep their non-detachable filesystems.
  bool manual = false;
  auto isManual = machine.isManual();
  if (isManual) {
    manual = *isManual;
  } else if (Status st = tolerate(force, isManual.status(), diag,
                                  "determining if machine " + machine.id() + " is manual"); !st) {
    return st;
  }

  return dyingEntityStorage(host, manual, filesystems, volumes, force, diag);
}

// A dying model cannot gain machines, so one listing is enough.
Status Cleaner::cleanupMachinesForDyingModel(const CleanupTask&, Diagnostics&) {
  auto machines = _state.allMachines();
  if (!machines) return annotate(machines.error(), "reading machines");

  for (const auto& m : *machines) {
    if (m->isManager()) continue;
    if (m->parentId()) continue;

    auto manual = m->isManual();
    if (!manual) return manual.error();

    // Manual machines are never force-destroyed without the user asking.
    Status st = *manual ? m->destroy() : m->forceDestroy();
    if (st.is(Errc::NotFound)) continue;
    if (!st) return st;
  }
  return {};
}

} // namespace reclaim::cleanup
