#pragma once

#include "reclaim/Result.hpp"
#include "reclaim/state/Life.hpp"

#include <optional>
#include <string>
#include <vector>

namespace reclaim::state {

struct StorageAttachment {
  std::string storageId;
  std::string unit;
};

struct FilesystemAttachment {
  std::string filesystemId;
  Tag host;
};

struct VolumeAttachment {
  std::string volumeId;
  Tag host;
};

struct FilesystemInfo {
  std::string id;
  std::optional<std::string> volumeId;   // set when volume-backed
};

// Storage instances, volumes, filesystems and their attachments.
class StorageBackend {
public:
  virtual ~StorageBackend() = default;

  // -- storage instances --
  virtual Result<std::vector<std::string>> allStorageInstances() const = 0;
  virtual Result<std::vector<StorageAttachment>> unitStorageAttachments(const std::string& unit) const = 0;
  virtual Result<std::vector<StorageAttachment>> storageAttachments(const std::string& storageId) const = 0;

  virtual Status destroyStorageInstance(const std::string& storageId, bool destroyAttached, bool force) = 0;
  virtual Status releaseStorageInstance(const std::string& storageId, bool destroyAttached, bool force) = 0;
  virtual Status detachStorage(const std::string& storageId, const std::string& unit, bool force) = 0;
  virtual Status removeStorageAttachment(const std::string& storageId, const std::string& unit, bool force) = 0;
  virtual Status destroyUnitStorageAttachments(const std::string& unit) = 0;

  // -- filesystems --
  virtual Result<std::vector<FilesystemAttachment>> filesystemAttachments(const Tag& host) const = 0;
  virtual Result<std::vector<FilesystemAttachment>> filesystemAttachmentsFor(const std::string& filesystemId) const = 0;
  // Non-detachable filesystems scoped to the host.
  virtual Result<std::vector<FilesystemInfo>> hostFilesystems(const Tag& host) const = 0;
  virtual Result<FilesystemInfo> filesystem(const std::string& filesystemId) const = 0;
  virtual Result<bool> isDetachableFilesystem(const std::string& filesystemId) const = 0;

  virtual Status destroyFilesystem(const std::string& filesystemId) = 0;
  virtual Status removeFilesystem(const std::string& filesystemId) = 0;
  virtual Status detachFilesystem(const Tag& host, const std::string& filesystemId) = 0;
  virtual Status removeFilesystemAttachment(const Tag& host, const std::string& filesystemId) = 0;
  virtual Status setFilesystemDetached(const std::string& filesystemId) = 0;

  // -- volumes --
  virtual Result<std::vector<VolumeAttachment>> volumeAttachments(const Tag& host) const = 0;
  virtual Result<std::vector<VolumeAttachment>> volumeAttachmentsFor(const std::string& volumeId) const = 0;
  virtual Result<bool> isDetachableVolume(const std::string& volumeId) const = 0;

  // ContainsFilesystem while a filesystem on the volume is still present.
  virtual Status detachVolume(const Tag& host, const std::string& volumeId) = 0;
  virtual Status removeVolumeAttachmentPlan(const Tag& host, const std::string& volumeId) = 0;
};

} // namespace reclaim::state
