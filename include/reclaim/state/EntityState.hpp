#pragma once

#include "reclaim/Result.hpp"
#include "reclaim/state/Entities.hpp"

#include <memory>
#include <string>
#include <vector>

namespace reclaim::state {

// Read access to the entity graph of one model, plus the few record
// removals that have no entity object of their own.
class EntityState {
public:
  virtual ~EntityState() = default;

  virtual Result<std::shared_ptr<Unit>> unit(const std::string& name) = 0;
  virtual Result<std::vector<std::shared_ptr<Unit>>> aliveUnits(const std::string& application) = 0;

  virtual Result<std::shared_ptr<Machine>> machine(const std::string& id) = 0;
  virtual Result<std::vector<std::shared_ptr<Machine>>> allMachines() = 0;
  virtual Status removeControllerMachine(Machine& machine) = 0;

  virtual Result<std::vector<std::shared_ptr<Application>>> aliveApplications() = 0;
  virtual Result<std::vector<std::shared_ptr<RemoteApplication>>> aliveRemoteApplications() = 0;

  // Controller-wide; only meaningful on the controller model.
  virtual Result<std::vector<std::string>> allModelUUIDs() = 0;
  virtual Result<std::shared_ptr<Model>> model(const std::string& uuid) = 0;

  virtual Result<std::shared_ptr<Charm>> charm(const std::string& url) = 0;

  virtual Result<std::vector<std::shared_ptr<Action>>> unitActions(const std::string& unitName) = 0;
  virtual Status removeUnitPayloads(const std::string& unitName) = 0;

  virtual Status removeRelationSettings(const std::string& prefix) = 0;
  virtual Status removeResourceBlob(const std::string& storagePath) = 0;
};

} // namespace reclaim::state
