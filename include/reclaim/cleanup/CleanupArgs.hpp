#pragma once

#include "reclaim/Result.hpp"
#include "reclaim/cleanup/CleanupKind.hpp"
#include "reclaim/state/Entities.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace reclaim::cleanup {

// One persisted argument: the text of a single JSON value.
using RawArg = std::string;

// The record predates arguments for its kind; handlers apply legacy defaults.
struct LegacyArgs {};

// units, dyingUnit
struct UnitDestroyArgs {
  bool destroyStorage = false;
  bool force = false;
};

// removedUnit, dyingMachine, storageAttachments, dyingUnitResources
struct ForceArgs {
  bool force = false;
};

// modelStorage; legacy records destroy storage.
struct ModelStorageArgs {
  bool destroyStorage = true;
  bool force = false;
};

using CleanupArgs = std::variant<
  LegacyArgs,
  UnitDestroyArgs,
  ForceArgs,
  ModelStorageArgs,
  state::DestroyModelParams
>;

std::vector<RawArg> encodeArgs(const UnitDestroyArgs& a);
std::vector<RawArg> encodeArgs(const ForceArgs& a);
std::vector<RawArg> encodeArgs(const ModelStorageArgs& a);
std::vector<RawArg> encodeArgs(const state::DestroyModelParams& p);

/// Highest argument count a kind accepts.
std::size_t maxArgs(CleanupKind kind);

/// Decodes raw arguments for `kind`; zero arguments yield LegacyArgs.
Result<CleanupArgs> decodeArgs(CleanupKind kind, const std::vector<RawArg>& raw);

// The typed payload when present, `legacy` for records without arguments.
template <typename T>
T argsOr(const CleanupArgs& args, const T& legacy) {
  if (auto p = std::get_if<T>(&args)) return *p;
  return legacy;
}

} // namespace reclaim::cleanup
