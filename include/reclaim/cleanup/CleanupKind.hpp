#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace reclaim::cleanup {

// Persisted as the wire strings returned by toString(); never rename those.
enum class CleanupKind {
  RelationSettings,
  UnitsForDyingApplication,
  Charm,
  DyingUnit,
  ForceDestroyedUnit,
  ForceRemoveUnit,
  RemovedUnit,
  ApplicationsForDyingModel,
  DyingMachine,
  ForceDestroyedMachine,
  AttachmentsForDyingStorage,
  AttachmentsForDyingVolume,
  AttachmentsForDyingFilesystem,
  ModelsForDyingController,
  MachinesForDyingModel,
  DyingUnitResources,
  ResourceBlob,
  StorageForDyingModel
};

inline constexpr std::size_t kCleanupKindCount = 18;

inline constexpr std::size_t indexOf(CleanupKind k) { return static_cast<std::size_t>(k); }

const std::array<CleanupKind, kCleanupKindCount>& allCleanupKinds();

const char* toString(CleanupKind kind);
std::optional<CleanupKind> parseCleanupKind(const std::string& wire);

} // namespace reclaim::cleanup
