#include "reclaim/cleanup/CleanupKind.hpp"

namespace reclaim::cleanup {

const std::array<CleanupKind, kCleanupKindCount>& allCleanupKinds() {
  static const std::array<CleanupKind, kCleanupKindCount> kinds{
    CleanupKind::RelationSettings,
    CleanupKind::UnitsForDyingApplication,
    CleanupKind::Charm,
    CleanupKind::DyingUnit,
    CleanupKind::ForceDestroyedUnit,
    CleanupKind::ForceRemoveUnit,
    CleanupKind::RemovedUnit,
    CleanupKind::ApplicationsForDyingModel,
    CleanupKind::DyingMachine,
    CleanupKind::ForceDestroyedMachine,
    CleanupKind::AttachmentsForDyingStorage,
    CleanupKind::AttachmentsForDyingVolume,
    CleanupKind::AttachmentsForDyingFilesystem,
    CleanupKind::ModelsForDyingController,
    CleanupKind::MachinesForDyingModel,
    CleanupKind::DyingUnitResources,
    CleanupKind::ResourceBlob,
    CleanupKind::StorageForDyingModel,
  };
  return kinds;
}

const char* toString(CleanupKind kind) {
  switch (kind) {
    case CleanupKind::RelationSettings:              return "settings";
    case CleanupKind::UnitsForDyingApplication:      return "units";
    case CleanupKind::Charm:                         return "charm";
    case CleanupKind::DyingUnit:                     return "dyingUnit";
    case CleanupKind::ForceDestroyedUnit:            return "forceDestroyUnit";
    case CleanupKind::ForceRemoveUnit:               return "forceRemoveUnit";
    case CleanupKind::RemovedUnit:                   return "removedUnit";
    case CleanupKind::ApplicationsForDyingModel:     return "applications";
    case CleanupKind::DyingMachine:                  return "dyingMachine";
    case CleanupKind::ForceDestroyedMachine:         return "machine";
    case CleanupKind::AttachmentsForDyingStorage:    return "storageAttachments";
    case CleanupKind::AttachmentsForDyingVolume:     return "volumeAttachments";
    case CleanupKind::AttachmentsForDyingFilesystem: return "filesystemAttachments";
    case CleanupKind::ModelsForDyingController:      return "models";
    case CleanupKind::MachinesForDyingModel:         return "modelMachines";
    case CleanupKind::DyingUnitResources:            return "dyingUnitResources";
    case CleanupKind::ResourceBlob:                  return "resourceBlob";
    case CleanupKind::StorageForDyingModel:          return "modelStorage";
  }
  return "unknown";
}

std::optional<CleanupKind> parseCleanupKind(const std::string& wire) {
  for (auto k : allCleanupKinds()) {
    if (wire == toString(k)) return k;
  }
  return std::nullopt;
}

} // namespace reclaim::cleanup
