#include "reclaim/cleanup/Cleaner.hpp"

#include "reclaim/util/Logger.hpp"

#include <optional>

namespace reclaim::cleanup {

using util::logger;
using util::LogLevel;

namespace {

// NotFound means the step already happened.
Status unlessGone(Status st) {
  if (st.is(Errc::NotFound)) return {};
  return st;
}

} // namespace

// A dying storage instance cannot gain attachments; detach the ones it has.
Status Cleaner::cleanupAttachmentsForDyingStorage(const CleanupTask& task, Diagnostics& diag) {
  const bool force = argsOr(task.args, ForceArgs{}).force;
  const std::string& storageId = task.prefix;

  auto attachments = _storage.storageAttachments(storageId);
  if (!attachments) return annotate(attachments.error(), "reading storage attachments");

  Status detachErr;
  for (const auto& a : *attachments) {
    Status st = unlessGone(_storage.detachStorage(storageId, a.unit, force));
    if (st) continue;
    detachErr = annotate(st, "destroying storage attachment");
    logger().log(LogLevel::Warn, "cleanup.detach_failed", {{"error", detachErr.describe()}});
    if (force) diag.add(detachErr);
  }
  if (!force) return detachErr;
  return {};
}

Status Cleaner::cleanupAttachmentsForDyingVolume(const CleanupTask& task, Diagnostics&) {
  const std::string& volumeId = task.prefix;

  auto attachments = _storage.volumeAttachmentsFor(volumeId);
  if (!attachments) return annotate(attachments.error(), "reading volume attachments");

  for (const auto& a : *attachments) {
    Status st = unlessGone(_storage.detachVolume(a.host, volumeId));
    if (!st) return annotate(st, "destroying volume attachment");
  }
  return {};
}

Status Cleaner::cleanupAttachmentsForDyingFilesystem(const CleanupTask& task, Diagnostics&) {
  const std::string& filesystemId = task.prefix;

  auto attachments = _storage.filesystemAttachmentsFor(filesystemId);
  if (!attachments) return annotate(attachments.error(), "reading filesystem attachments");

  for (const auto& a : *attachments) {
    Status st = unlessGone(_storage.detachFilesystem(a.host, filesystemId));
    if (!st) return annotate(st, "destroying filesystem attachment");
  }
  return {};
}

Status Cleaner::cleanupStorageForDyingModel(const CleanupTask& task, Diagnostics&) {
  const auto args = argsOr(task.args, ModelStorageArgs{});

  auto instances = _storage.allStorageInstances();
  if (!instances) return annotate(instances.error(), "reading storage instances");

  constexpr bool destroyAttached = true;
  for (const auto& id : *instances) {
    Status st = args.destroyStorage
                  ? _storage.destroyStorageInstance(id, destroyAttached, args.force)
                  : _storage.releaseStorageInstance(id, destroyAttached, args.force);
    if (st.is(Errc::NotFound)) continue;
    if (!st) return st;
  }
  return {};
}

// Shared by dying machines and dying units: destroy what is bound to the
// host, detach what can outlive it.
Status Cleaner::dyingEntityStorage(const state::Tag& host, bool manual,
                                   const std::vector<state::FilesystemAttachment>& filesystemAttachments,
                                   const std::vector<state::VolumeAttachment>& volumeAttachments,
                                   bool force, Diagnostics& diag) {
  const std::string hostName = host.str();

  std::vector<state::FilesystemInfo> filesystems;
  auto hostFs = _storage.hostFilesystems(host);
  if (hostFs) {
    filesystems = std::move(*hostFs);
  } else if (Status st = tolerate(force, unlessGone(hostFs.status()), diag, "getting host filesystems"); !st) {
    return st;
  }

  for (const auto& f : filesystems) {
    Status st = tolerate(force, unlessGone(_storage.destroyFilesystem(f.id)), diag,
                         "destroying filesystem " + f.id + " for " + hostName);
    if (!st) return st;
  }

  for (const auto& fsa : filesystemAttachments) {
    bool detachable = false;
    auto d = _storage.isDetachableFilesystem(fsa.filesystemId);
    if (d) {
      detachable = *d;
    } else if (Status st = tolerate(force, unlessGone(d.status()), diag,
                                    "checking if filesystem " + fsa.filesystemId + " is detachable"); !st) {
      return st;
    }

    if (detachable) {
      Status st = tolerate(force, unlessGone(_storage.detachFilesystem(fsa.host, fsa.filesystemId)), diag,
                           "detaching filesystem " + fsa.filesystemId + " for " + hostName);
      if (!st) return st;
    }

    if (manual) continue;

    // Non-manual hosts are about to be terminated: drop attachments of
    // non-detachable or volume-backed filesystems right away.
    bool remove = false;
    bool markDetached = false;
    std::optional<std::string> volumeId;
    if (!detachable) {
      remove = true;
    } else {
      auto info = _storage.filesystem(fsa.filesystemId);
      if (info) {
        if (info->volumeId) {
          volumeId = info->volumeId;
          remove = true;
          markDetached = true;
        }
      } else if (Status st = tolerate(force, unlessGone(info.status()), diag,
                                      "getting filesystem " + fsa.filesystemId); !st) {
        return st;
      }
    }
    if (!remove) continue;

    Status st = tolerate(force, unlessGone(_storage.removeFilesystemAttachment(fsa.host, fsa.filesystemId)), diag,
                         "removing attachment for filesystem " + fsa.filesystemId + " for " + hostName);
    if (!st) return st;

    if (volumeId) {
      st = tolerate(force, unlessGone(_storage.removeVolumeAttachmentPlan(fsa.host, *volumeId)), diag,
                    "removing attachment plan for volume " + *volumeId + " for " + hostName);
      if (!st) return st;
    }
    if (markDetached) {
      st = tolerate(force, unlessGone(_storage.setFilesystemDetached(fsa.filesystemId)), diag,
                    "updating status of filesystem " + fsa.filesystemId);
      if (!st) return st;
    }
  }

  // Stuck filesystems on manual machines are left for the operator.
  if (!manual) {
    for (const auto& f : filesystems) {
      Status st = tolerate(force, unlessGone(_storage.removeFilesystem(f.id)), diag,
                           "removing filesystem " + f.id + " for dying " + hostName);
      if (!st) return st;
    }
  }

  for (const auto& va : volumeAttachments) {
    auto d = _storage.isDetachableVolume(va.volumeId);
    if (d) {
      // Non-detachable volumes go with the host.
      if (!*d) continue;
    } else if (d.is(Errc::NotFound)) {
      continue;
    } else if (Status st = tolerate(force, d.status(), diag,
                                    "checking if volume " + va.volumeId + " is detachable"); !st) {
      return st;
    }

    Status detached = _storage.detachVolume(va.host, va.volumeId);
    if (detached.is(Errc::ContainsFilesystem)) {
      // Destroyed along with the filesystem on it.
      continue;
    }
    Status st = tolerate(force, unlessGone(detached), diag,
                         "detaching volume " + va.volumeId + " for dying " + hostName);
    if (!st) return st;
  }
  return {};
}

} // namespace reclaim::cleanup
