#pragma once

#include "reclaim/Result.hpp"
#include "reclaim/state/Life.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Lifecycle operations the cleanup engine drives. Implementations belong to
// the state layer; every operation reports Errc::NotFound when the entity is
// already gone.
namespace reclaim::state {

class RelationUnit {
public:
  virtual ~RelationUnit() = default;

  // Signals that the unit is about to depart, without leaving yet.
  virtual Status prepareLeaveScope() = 0;
  virtual Status leaveScope() = 0;
};

class Relation {
public:
  virtual ~Relation() = default;

  virtual std::string key() const = 0;
  virtual Result<std::shared_ptr<RelationUnit>> unit(const std::string& unitName) = 0;
};

using Relations = std::vector<std::shared_ptr<Relation>>;

struct DestroyUnitParams {
  bool destroyStorage = false;
  bool force = false;
};

class Unit {
public:
  virtual ~Unit() = default;

  virtual std::string name() const = 0;
  virtual Life life() const = 0;
  virtual std::vector<std::string> subordinateNames() const = 0;

  virtual Result<Relations> relationsJoined() const = 0;
  virtual Result<Relations> relationsInScope() const = 0;

  virtual Status destroy(const DestroyUnitParams& params) = 0;
  virtual Forced destroyWithForce(bool force) = 0;

  // Fails with HasSubordinates or HasStorageAttachments while dependents remain.
  virtual Status ensureDead() = 0;
  virtual Forced removeWithForce(bool force) = 0;

  virtual Status refresh() = 0;
};

class Machine {
public:
  virtual ~Machine() = default;

  virtual std::string id() const = 0;
  virtual Life life() const = 0;
  virtual bool isManager() const = 0;
  virtual bool hasVote() const = 0;
  virtual Result<bool> isManual() const = 0;
  virtual std::optional<std::string> parentId() const = 0;
  virtual Result<std::vector<std::string>> containers() const = 0;
  virtual std::vector<std::string> principals() const = 0;

  virtual Status destroy() = 0;
  virtual Status forceDestroy() = 0;
  virtual Status ensureDead() = 0;
  virtual Status remove() = 0;
  virtual Status refresh() = 0;

  // Compare-and-swap on the vote flag; TxnAborted if it changed underneath.
  virtual Status setHasVote(bool hasVote) = 0;
  virtual Status removeUpgradeSeriesLock() = 0;
  virtual Status removeOpenedPorts() = 0;
};

struct DestroyApplicationParams {
  bool removeOffers = false;
  bool destroyStorage = false;
  bool force = false;
};

class Application {
public:
  virtual ~Application() = default;
  virtual std::string name() const = 0;
  virtual Status destroy(const DestroyApplicationParams& params) = 0;
};

class RemoteApplication {
public:
  virtual ~RemoteApplication() = default;
  virtual std::string name() const = 0;
  virtual Status destroy() = 0;
};

struct DestroyModelParams {
  std::optional<bool> destroyStorage;
  std::optional<bool> force;
  std::optional<std::chrono::milliseconds> maxWait;

  bool operator==(const DestroyModelParams& o) const {
    return destroyStorage == o.destroyStorage && force == o.force && maxWait == o.maxWait;
  }
};

class Model {
public:
  virtual ~Model() = default;
  virtual std::string uuid() const = 0;
  virtual Status destroy(const DestroyModelParams& params) = 0;
};

class Charm {
public:
  virtual ~Charm() = default;
  virtual std::string url() const = 0;
  // CharmInUse while any application still references it.
  virtual Status destroy() = 0;
  virtual Status remove() = 0;
};

enum class ActionStatus { Pending, Running, Completed, Cancelled, Failed };

struct ActionResults {
  ActionStatus status = ActionStatus::Completed;
  std::string message;
};

class Action {
public:
  virtual ~Action() = default;
  virtual std::string id() const = 0;
  virtual std::string name() const = 0;
  virtual ActionStatus status() const = 0;
  virtual Status finish(const ActionResults& results) = 0;
};

} // namespace reclaim::state
