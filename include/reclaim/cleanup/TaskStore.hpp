#pragma once

#include "reclaim/Result.hpp"
#include "reclaim/cleanup/CleanupArgs.hpp"
#include "reclaim/cleanup/CleanupKind.hpp"
#include "reclaim/store/Database.hpp"
#include "reclaim/util/Clock.hpp"

#include <optional>
#include <string>
#include <vector>

namespace reclaim::cleanup {

inline constexpr const char* kCleanupsCollection = "cleanups";

// A cleanup record exactly as persisted. `kind` stays a string so records
// written by a newer build can still be read, reported and left in place.
struct CleanupDoc {
  std::string id;
  std::string kind;
  std::optional<TimePoint> when;    // absent in old records: due now
  std::string prefix;
  std::vector<RawArg> args;
};

// A decoded record, ready for dispatch.
struct CleanupTask {
  std::string id;
  CleanupKind kind = CleanupKind::RelationSettings;
  std::string prefix;
  TimePoint dueAt = asap;
  CleanupArgs args;
};

/// Unique 24 hex digit id: seconds timestamp, process-random value, counter.
std::string newCleanupId();

std::string encodeCleanupDoc(const CleanupDoc& doc);
Result<CleanupDoc> decodeCleanupDoc(const store::Document& doc);
Result<CleanupTask> decodeTask(const CleanupDoc& doc);

/// Ops that create a cleanup record; add them to the transaction that
/// makes the cleanup necessary so both commit or neither does.
store::TxnOp newCleanupOp(CleanupKind kind, const std::string& prefix, std::vector<RawArg> args = {});
store::TxnOp newCleanupAtOp(TimePoint when, CleanupKind kind, const std::string& prefix,
                            std::vector<RawArg> args = {});

class TaskStore {
public:
  explicit TaskStore(store::Database& db) : _db(db) {}

  Status enqueue(CleanupKind kind, const std::string& prefix, std::vector<RawArg> args = {});
  Status enqueueAt(TimePoint when, CleanupKind kind, const std::string& prefix,
                   std::vector<RawArg> args = {});

  Result<bool> hasPending() const;
  Result<std::size_t> pendingCount() const;

  /// Records whose due time has passed (or that carry none), oldest first
  /// and by id within the same due time.
  Result<std::vector<CleanupDoc>> due(TimePoint now) const;
  Result<std::vector<CleanupDoc>> all() const;

  /// Deletes a completed record. Another drainer deleting it first is not
  /// an error: the work was already done.
  Status remove(const std::string& id);

  store::Database& database() { return _db; }

private:
  store::Database& _db;
};

} // namespace reclaim::cleanup
