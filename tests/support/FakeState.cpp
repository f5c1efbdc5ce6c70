#include "FakeState.hpp"

#include "reclaim/cleanup/CleanupArgs.hpp"

#include <algorithm>

namespace reclaim::fake {

namespace {

Error notFound(const std::string& what) {
  return makeError(Errc::NotFound, what + " not found");
}

template <typename T>
void eraseValue(std::vector<T>& v, const T& value) {
  v.erase(std::remove(v.begin(), v.end(), value), v.end());
}

std::string applicationOf(const std::string& unitName) {
  return unitName.substr(0, unitName.find('/'));
}

// ---------------------------------------------------------------- relations

class FakeRelationUnit : public state::RelationUnit {
public:
  FakeRelationUnit(FakeWorld& w, std::string key, std::string unit)
    : _w(w), _key(std::move(key)), _unit(std::move(unit)) {}

  Status prepareLeaveScope() override {
    auto it = _w.relations.find(_key);
    if (it == _w.relations.end()) return notFound("relation " + _key);
    if (Status st = _w.begin("relation.prepareLeave " + _key + " " + _unit); !st) return st;
    it->second.departing.insert(_unit);
    return {};
  }

  Status leaveScope() override {
    auto it = _w.relations.find(_key);
    if (it == _w.relations.end()) return notFound("relation " + _key);
    if (Status st = _w.begin("relation.leave " + _key + " " + _unit); !st) return st;
    it->second.joined.erase(_unit);
    it->second.inScope.erase(_unit);
    return {};
  }

private:
  FakeWorld& _w;
  std::string _key;
  std::string _unit;
};

class FakeRelation : public state::Relation {
public:
  FakeRelation(FakeWorld& w, std::string key) : _w(w), _key(std::move(key)) {}

  std::string key() const override { return _key; }

  Result<std::shared_ptr<state::RelationUnit>> unit(const std::string& unitName) override {
    if (Status st = _w.check("relation.unit " + _key + " " + unitName); !st) return st.error();
    auto it = _w.relations.find(_key);
    if (it == _w.relations.end()) return notFound("relation " + _key);
    if (!it->second.joined.count(unitName) && !it->second.inScope.count(unitName)) {
      return notFound("unit " + unitName + " in relation " + _key);
    }
    return std::shared_ptr<state::RelationUnit>(std::make_shared<FakeRelationUnit>(_w, _key, unitName));
  }

private:
  FakeWorld& _w;
  std::string _key;
};

// -------------------------------------------------------------------- units

class FakeUnit : public state::Unit {
public:
  FakeUnit(FakeWorld& w, std::string name) : _w(w), _name(std::move(name)) {}

  std::string name() const override { return _name; }

  Life life() const override {
    auto it = _w.units.find(_name);
    return it == _w.units.end() ? Life::Dead : it->second.life;
  }

  std::vector<std::string> subordinateNames() const override {
    auto it = _w.units.find(_name);
    if (it == _w.units.end()) return {};
    return it->second.subordinates;
  }

  Result<state::Relations> relationsJoined() const override {
    if (Status st = _w.check("unit.relationsJoined " + _name); !st) return st.error();
    state::Relations out;
    for (const auto& [key, rel] : _w.relations) {
      if (rel.joined.count(_name)) out.push_back(std::make_shared<FakeRelation>(_w, key));
    }
    return out;
  }

  Result<state::Relations> relationsInScope() const override {
    if (Status st = _w.check("unit.relationsInScope " + _name); !st) return st.error();
    state::Relations out;
    for (const auto& [key, rel] : _w.relations) {
      if (rel.inScope.count(_name)) out.push_back(std::make_shared<FakeRelation>(_w, key));
    }
    return out;
  }

  Status destroy(const state::DestroyUnitParams& params) override {
    auto it = _w.units.find(_name);
    if (it == _w.units.end()) return notFound("unit " + _name);
    if (Status st = _w.begin("unit.destroy " + _name); !st) return st;
    if (it->second.life != Life::Alive) return {};
    return _w.destroyUnitRecord(_name, params.destroyStorage, params.force);
  }

  Forced destroyWithForce(bool force) override {
    Forced out;
    auto it = _w.units.find(_name);
    if (it == _w.units.end()) {
      out.status = notFound("unit " + _name);
      return out;
    }
    if (Status st = _w.begin("unit.destroyWithForce " + _name); !st) {
      out.status = st;
      return out;
    }
    if (it->second.life == Life::Alive) {
      out.status = _w.destroyUnitRecord(_name, false, force);
    } else if (force) {
      // A forced destroy of a unit that is already on its way out skips the agent.
      _w.eraseUnit(_name);
    }
    return out;
  }

  Status ensureDead() override {
    auto it = _w.units.find(_name);
    if (it == _w.units.end()) return {};
    if (Status st = _w.begin("unit.ensureDead " + _name); !st) return st;
    if (!it->second.subordinates.empty()) {
      return makeError(Errc::HasSubordinates, "unit has subordinates", _name);
    }
    if (_w.hasStorageAttachments(_name)) {
      return makeError(Errc::HasStorageAttachments, "unit has storage attachments", _name);
    }
    it->second.life = Life::Dead;
    return {};
  }

  Forced removeWithForce(bool force) override {
    Forced out;
    auto it = _w.units.find(_name);
    if (it == _w.units.end()) {
      out.status = notFound("unit " + _name);
      return out;
    }
    if (Status st = _w.begin("unit.removeWithForce " + _name); !st) {
      out.status = st;
      return out;
    }
    if (it->second.life != Life::Dead) {
      if (!force) {
        out.status = makeError(Errc::Internal, "unit is not dead", _name);
        return out;
      }
      out.diagnostics.add(makeError(Errc::Internal, "removing unit that is not dead", _name));
    }
    _w.eraseUnit(_name);
    return out;
  }

  Status refresh() override {
    if (!_w.units.count(_name)) return notFound("unit " + _name);
    return {};
  }

private:
  FakeWorld& _w;
  std::string _name;
};

// ----------------------------------------------------------------- machines

class FakeMachine : public state::Machine {
public:
  FakeMachine(FakeWorld& w, std::string id) : _w(w), _id(std::move(id)) {}

  std::string id() const override { return _id; }

  Life life() const override {
    const auto* m = rec();
    return m ? m->life : Life::Dead;
  }
  bool isManager() const override { const auto* m = rec(); return m && m->manager; }
  bool hasVote() const override   { const auto* m = rec(); return m && m->hasVote; }

  Result<bool> isManual() const override {
    if (Status st = _w.check("machine.isManual " + _id); !st) return st.error();
    const auto* m = rec();
    if (!m) return notFound("machine " + _id);
    return m->manual;
  }

  std::optional<std::string> parentId() const override {
    const auto* m = rec();
    return m ? m->parent : std::nullopt;
  }

  Result<std::vector<std::string>> containers() const override {
    const auto* m = rec();
    if (!m) return notFound("machine " + _id);
    return m->containers;
  }

  std::vector<std::string> principals() const override {
    const auto* m = rec();
    return m ? m->principals : std::vector<std::string>{};
  }

  Status destroy() override { return markDying("machine.destroy "); }
  Status forceDestroy() override { return markDying("machine.forceDestroy "); }

  Status ensureDead() override {
    auto* m = rec();
    if (!m) return {};
    if (Status st = _w.begin("machine.ensureDead " + _id); !st) return st;
    if (!m->principals.empty()) return makeError(Errc::Internal, "machine has assigned units", _id);
    if (!m->containers.empty()) return makeError(Errc::Internal, "machine has containers", _id);
    m->life = Life::Dead;
    return {};
  }

  Status remove() override {
    auto* m = rec();
    if (!m) return notFound("machine " + _id);
    if (Status st = _w.begin("machine.remove " + _id); !st) return st;
    if (m->life != Life::Dead) return makeError(Errc::Internal, "machine is not dead", _id);
    if (m->parent) {
      auto p = _w.machines.find(*m->parent);
      if (p != _w.machines.end()) eraseValue(p->second.containers, _id);
    }
    _w.machines.erase(_id);
    return {};
  }

  Status refresh() override {
    if (!rec()) return notFound("machine " + _id);
    return {};
  }

  Status setHasVote(bool vote) override {
    auto* m = rec();
    if (!m) return notFound("machine " + _id);
    if (m->voteConflicts > 0) {
      --m->voteConflicts;
      return makeError(Errc::TxnAborted, "vote changed concurrently", _id);
    }
    if (Status st = _w.begin("machine.setHasVote " + _id); !st) return st;
    m->hasVote = vote;
    return {};
  }

  Status removeUpgradeSeriesLock() override {
    auto* m = rec();
    if (!m) return notFound("machine " + _id);
    if (!m->upgradeLock) return notFound("upgrade series lock for " + _id);
    if (Status st = _w.begin("machine.removeUpgradeSeriesLock " + _id); !st) return st;
    m->upgradeLock = false;
    return {};
  }

  Status removeOpenedPorts() override {
    auto* m = rec();
    if (!m) return notFound("machine " + _id);
    if (Status st = _w.begin("machine.removeOpenedPorts " + _id); !st) return st;
    m->openedPorts = false;
    return {};
  }

private:
  MachineRec* rec() const {
    auto it = _w.machines.find(_id);
    return it == _w.machines.end() ? nullptr : &it->second;
  }

  Status markDying(const std::string& op) {
    auto* m = rec();
    if (!m) return notFound("machine " + _id);
    if (Status st = _w.begin(op + _id); !st) return st;
    if (m->life == Life::Alive) m->life = Life::Dying;
    return {};
  }

  FakeWorld& _w;
  std::string _id;
};

// ------------------------------------------------------- model-wide entities

class FakeApplication : public state::Application {
public:
  FakeApplication(FakeWorld& w, std::string name) : _w(w), _name(std::move(name)) {}

  std::string name() const override { return _name; }

  Status destroy(const state::DestroyApplicationParams& params) override {
    auto it = _w.applications.find(_name);
    if (it == _w.applications.end()) return notFound("application " + _name);
    if (Status st = _w.begin("application.destroy " + _name); !st) return st;
    it->second.life = Life::Dying;
    it->second.destroyedWith = params;

    cleanup::UnitDestroyArgs args;
    args.destroyStorage = params.destroyStorage;
    args.force = params.force;
    return _w.enqueue(cleanup::CleanupKind::UnitsForDyingApplication, _name, cleanup::encodeArgs(args));
  }

private:
  FakeWorld& _w;
  std::string _name;
};

class FakeRemoteApplication : public state::RemoteApplication {
public:
  FakeRemoteApplication(FakeWorld& w, std::string name) : _w(w), _name(std::move(name)) {}

  std::string name() const override { return _name; }

  Status destroy() override {
    auto it = _w.applications.find(_name);
    if (it == _w.applications.end()) return notFound("remote application " + _name);
    if (Status st = _w.begin("remoteApplication.destroy " + _name); !st) return st;
    it->second.life = Life::Dying;
    return {};
  }

private:
  FakeWorld& _w;
  std::string _name;
};

class FakeModel : public state::Model {
public:
  FakeModel(FakeWorld& w, std::string uuid) : _w(w), _uuid(std::move(uuid)) {}

  std::string uuid() const override { return _uuid; }

  Status destroy(const state::DestroyModelParams& params) override {
    auto it = _w.models.find(_uuid);
    if (it == _w.models.end()) return notFound("model " + _uuid);
    if (Status st = _w.begin("model.destroy " + _uuid); !st) return st;
    it->second.life = Life::Dying;
    it->second.destroyedWith = params;
    return {};
  }

private:
  FakeWorld& _w;
  std::string _uuid;
};

class FakeCharm : public state::Charm {
public:
  FakeCharm(FakeWorld& w, std::string url) : _w(w), _url(std::move(url)) {}

  std::string url() const override { return _url; }

  Status destroy() override {
    auto it = _w.charms.find(_url);
    if (it == _w.charms.end()) return notFound("charm " + _url);
    if (Status st = _w.begin("charm.destroy " + _url); !st) return st;
    if (it->second.inUse) return makeError(Errc::CharmInUse, "charm in use", _url);
    it->second.dying = true;
    return {};
  }

  Status remove() override {
    auto it = _w.charms.find(_url);
    if (it == _w.charms.end()) return notFound("charm " + _url);
    if (Status st = _w.begin("charm.remove " + _url); !st) return st;
    _w.charms.erase(it);
    return {};
  }

private:
  FakeWorld& _w;
  std::string _url;
};

class FakeAction : public state::Action {
public:
  FakeAction(FakeWorld& w, std::string id) : _w(w), _id(std::move(id)) {}

  std::string id() const override { return _id; }

  std::string name() const override {
    auto it = _w.actions.find(_id);
    return it == _w.actions.end() ? std::string() : it->second.name;
  }

  state::ActionStatus status() const override {
    auto it = _w.actions.find(_id);
    return it == _w.actions.end() ? state::ActionStatus::Completed : it->second.status;
  }

  Status finish(const state::ActionResults& results) override {
    auto it = _w.actions.find(_id);
    if (it == _w.actions.end()) return notFound("action " + _id);
    if (Status st = _w.begin("action.finish " + _id); !st) return st;
    it->second.status = results.status;
    it->second.message = results.message;
    return {};
  }

private:
  FakeWorld& _w;
  std::string _id;
};

} // namespace

// -------------------------------------------------------------------- setup

UnitRec& FakeWorld::addUnit(const std::string& name, const std::string& machine) {
  UnitRec& u = units[name];
  u.application = applicationOf(name);
  u.machine = machine;
  if (!machine.empty()) machines[machine].principals.push_back(name);
  return u;
}

UnitRec& FakeWorld::addSubordinate(const std::string& principal, const std::string& name) {
  UnitRec& u = units[name];
  u.application = applicationOf(name);
  u.principal = principal;
  units[principal].subordinates.push_back(name);
  return u;
}

MachineRec& FakeWorld::addMachine(const std::string& id, const std::optional<std::string>& parent) {
  MachineRec& m = machines[id];
  if (parent) {
    m.parent = parent;
    machines[*parent].containers.push_back(id);
  }
  return machines[id];
}

RelationRec& FakeWorld::addRelation(const std::string& key, const std::vector<std::string>& members) {
  RelationRec& r = relations[key];
  r.joined.insert(members.begin(), members.end());
  r.inScope.insert(members.begin(), members.end());
  return r;
}

void FakeWorld::addStorage(const std::string& storageId, const std::string& unitName) {
  storage[storageId] = Life::Alive;
  if (!unitName.empty()) storageAttachmentLife[{storageId, unitName}] = Life::Alive;
}

FilesystemRec& FakeWorld::addFilesystem(const std::string& id) { return filesystems[id]; }

void FakeWorld::attachFilesystem(const Tag& host, const std::string& filesystemId) {
  filesystemAttachmentLife[{host, filesystemId}] = Life::Alive;
}

VolumeRec& FakeWorld::addVolume(const std::string& id) { return volumes[id]; }

void FakeWorld::attachVolume(const Tag& host, const std::string& volumeId, bool withPlan) {
  volumeAttachmentLife[{host, volumeId}] = Life::Alive;
  if (withPlan) volumePlans.insert({host, volumeId});
}

ApplicationRec& FakeWorld::addApplication(const std::string& name, bool remote) {
  ApplicationRec& a = applications[name];
  a.remote = remote;
  return a;
}

ModelRec& FakeWorld::addModel(const std::string& uuid) { return models[uuid]; }

CharmRec& FakeWorld::addCharm(const std::string& url, bool inUse) {
  CharmRec& c = charms[url];
  c.inUse = inUse;
  return c;
}

ActionRec& FakeWorld::addAction(const std::string& id, const std::string& unitName, const std::string& name,
                                state::ActionStatus status) {
  ActionRec& a = actions[id];
  a.unit = unitName;
  a.name = name;
  a.status = status;
  return a;
}

void FakeWorld::fail(const std::string& event, Errc code, int times) {
  _failures[event] = Failure{code, times};
}

bool FakeWorld::happened(const std::string& event) const {
  return std::find(_events.begin(), _events.end(), event) != _events.end();
}

Status FakeWorld::consume(const std::string& event) const {
  auto it = _failures.find(event);
  if (it == _failures.end() || it->second.remaining == 0) return {};
  if (it->second.remaining > 0) --it->second.remaining;
  return makeError(it->second.code, "injected failure: " + event);
}

Status FakeWorld::begin(const std::string& event) {
  if (Status st = consume(event); !st) return st;
  _events.push_back(event);
  return {};
}

Status FakeWorld::check(const std::string& event) const {
  return consume(event);
}

Status FakeWorld::enqueue(cleanup::CleanupKind kind, const std::string& prefix, std::vector<cleanup::RawArg> args) {
  if (!_tasks) return {};
  return _tasks->enqueue(kind, prefix, std::move(args));
}

bool FakeWorld::hasStorageAttachments(const std::string& unitName) const {
  for (const auto& [key, life] : storageAttachmentLife) {
    if (key.second == unitName) return true;
  }
  return false;
}

Status FakeWorld::destroyUnitRecord(const std::string& name, bool destroyStorage, bool force) {
  UnitRec& u = units.at(name);
  if (!u.agentRunning && u.subordinates.empty() && !hasStorageAttachments(name)) {
    eraseUnit(name);
    return {};
  }
  u.life = Life::Dying;

  cleanup::UnitDestroyArgs args;
  args.destroyStorage = destroyStorage;
  args.force = force;
  return enqueue(cleanup::CleanupKind::DyingUnit, name, cleanup::encodeArgs(args));
}

void FakeWorld::eraseUnit(const std::string& name) {
  auto it = units.find(name);
  if (it == units.end()) return;
  if (it->second.principal) {
    auto p = units.find(*it->second.principal);
    if (p != units.end()) eraseValue(p->second.subordinates, name);
  }
  if (!it->second.machine.empty()) {
    auto m = machines.find(it->second.machine);
    if (m != machines.end()) eraseValue(m->second.principals, name);
  }
  for (auto& [key, rel] : relations) {
    rel.joined.erase(name);
    rel.inScope.erase(name);
  }
  units.erase(it);
}

// -------------------------------------------------------------- EntityState

Result<std::shared_ptr<state::Unit>> FakeWorld::unit(const std::string& name) {
  if (Status st = check("unit.get " + name); !st) return st.error();
  if (!units.count(name)) return notFound("unit " + name);
  return std::shared_ptr<state::Unit>(std::make_shared<FakeUnit>(*this, name));
}

Result<std::vector<std::shared_ptr<state::Unit>>> FakeWorld::aliveUnits(const std::string& application) {
  std::vector<std::shared_ptr<state::Unit>> out;
  for (const auto& [name, u] : units) {
    if (u.application == application && u.life == Life::Alive) {
      out.push_back(std::make_shared<FakeUnit>(*this, name));
    }
  }
  return out;
}

Result<std::shared_ptr<state::Machine>> FakeWorld::machine(const std::string& id) {
  if (Status st = check("machine.get " + id); !st) return st.error();
  if (!machines.count(id)) return notFound("machine " + id);
  return std::shared_ptr<state::Machine>(std::make_shared<FakeMachine>(*this, id));
}

Result<std::vector<std::shared_ptr<state::Machine>>> FakeWorld::allMachines() {
  std::vector<std::shared_ptr<state::Machine>> out;
  for (const auto& [id, m] : machines) out.push_back(std::make_shared<FakeMachine>(*this, id));
  return out;
}

Status FakeWorld::removeControllerMachine(state::Machine& m) {
  if (Status st = begin("controller.remove " + m.id()); !st) return st;
  controllers.erase(m.id());
  return {};
}

Result<std::vector<std::shared_ptr<state::Application>>> FakeWorld::aliveApplications() {
  std::vector<std::shared_ptr<state::Application>> out;
  for (const auto& [name, a] : applications) {
    if (!a.remote && a.life == Life::Alive) out.push_back(std::make_shared<FakeApplication>(*this, name));
  }
  return out;
}

Result<std::vector<std::shared_ptr<state::RemoteApplication>>> FakeWorld::aliveRemoteApplications() {
  std::vector<std::shared_ptr<state::RemoteApplication>> out;
  for (const auto& [name, a] : applications) {
    if (a.remote && a.life == Life::Alive) out.push_back(std::make_shared<FakeRemoteApplication>(*this, name));
  }
  return out;
}

Result<std::vector<std::string>> FakeWorld::allModelUUIDs() {
  std::vector<std::string> out;
  for (const auto& [uuid, m] : models) out.push_back(uuid);
  return out;
}

Result<std::shared_ptr<state::Model>> FakeWorld::model(const std::string& uuid) {
  if (!models.count(uuid)) return notFound("model " + uuid);
  return std::shared_ptr<state::Model>(std::make_shared<FakeModel>(*this, uuid));
}

Result<std::shared_ptr<state::Charm>> FakeWorld::charm(const std::string& url) {
  if (Status st = check("charm.get " + url); !st) return st.error();
  if (!charms.count(url)) return notFound("charm " + url);
  return std::shared_ptr<state::Charm>(std::make_shared<FakeCharm>(*this, url));
}

Result<std::vector<std::shared_ptr<state::Action>>> FakeWorld::unitActions(const std::string& unitName) {
  if (Status st = check("unit.actions " + unitName); !st) return st.error();
  std::vector<std::shared_ptr<state::Action>> out;
  for (const auto& [id, a] : actions) {
    if (a.unit == unitName) out.push_back(std::make_shared<FakeAction>(*this, id));
  }
  return out;
}

Status FakeWorld::removeUnitPayloads(const std::string& unitName) {
  if (!payloads.count(unitName)) return {};
  if (Status st = begin("payloads.remove " + unitName); !st) return st;
  payloads.erase(unitName);
  return {};
}

Status FakeWorld::removeRelationSettings(const std::string& prefix) {
  const bool any = std::any_of(relationSettings.begin(), relationSettings.end(),
                               [&](const std::string& k) { return k.compare(0, prefix.size(), prefix) == 0; });
  if (Status st = check("settings.remove " + prefix); !st) return st;
  if (!any) return {};
  _events.push_back("settings.remove " + prefix);
  for (auto it = relationSettings.begin(); it != relationSettings.end();) {
    if (it->compare(0, prefix.size(), prefix) == 0) it = relationSettings.erase(it);
    else ++it;
  }
  return {};
}

Status FakeWorld::removeResourceBlob(const std::string& storagePath) {
  if (!blobs.count(storagePath)) return notFound("blob " + storagePath);
  if (Status st = begin("blob.remove " + storagePath); !st) return st;
  blobs.erase(storagePath);
  return {};
}

// ----------------------------------------------------------- StorageBackend

Result<std::vector<std::string>> FakeWorld::allStorageInstances() const {
  if (Status st = check("storage.all"); !st) return st.error();
  std::vector<std::string> out;
  for (const auto& [id, life] : storage) out.push_back(id);
  return out;
}

Result<std::vector<state::StorageAttachment>> FakeWorld::unitStorageAttachments(const std::string& unitName) const {
  if (Status st = check("storage.unitAttachments " + unitName); !st) return st.error();
  std::vector<state::StorageAttachment> out;
  for (const auto& [key, life] : storageAttachmentLife) {
    if (key.second == unitName) out.push_back({key.first, key.second});
  }
  return out;
}

Result<std::vector<state::StorageAttachment>> FakeWorld::storageAttachments(const std::string& storageId) const {
  if (Status st = check("storage.attachments " + storageId); !st) return st.error();
  std::vector<state::StorageAttachment> out;
  for (const auto& [key, life] : storageAttachmentLife) {
    if (key.first == storageId) out.push_back({key.first, key.second});
  }
  return out;
}

Status FakeWorld::destroyStorageInstance(const std::string& storageId, bool destroyAttached, bool) {
  auto it = storage.find(storageId);
  if (it == storage.end()) return notFound("storage " + storageId);
  if (Status st = begin("storage.destroy " + storageId); !st) return st;
  if (it->second == Life::Alive) it->second = Life::Dying;
  if (destroyAttached) {
    for (auto& [key, life] : storageAttachmentLife) {
      if (key.first == storageId && life == Life::Alive) life = Life::Dying;
    }
  }
  return {};
}

Status FakeWorld::releaseStorageInstance(const std::string& storageId, bool destroyAttached, bool) {
  auto it = storage.find(storageId);
  if (it == storage.end()) return notFound("storage " + storageId);
  if (Status st = begin("storage.release " + storageId); !st) return st;
  if (it->second == Life::Alive) it->second = Life::Dying;
  if (destroyAttached) {
    for (auto& [key, life] : storageAttachmentLife) {
      if (key.first == storageId && life == Life::Alive) life = Life::Dying;
    }
  }
  return {};
}

Status FakeWorld::detachStorage(const std::string& storageId, const std::string& unitName, bool) {
  auto it = storageAttachmentLife.find({storageId, unitName});
  if (it == storageAttachmentLife.end()) return notFound("storage attachment " + storageId);
  if (Status st = begin("storage.detach " + storageId + " " + unitName); !st) return st;
  if (it->second == Life::Alive) it->second = Life::Dying;
  return {};
}

Status FakeWorld::removeStorageAttachment(const std::string& storageId, const std::string& unitName, bool) {
  auto it = storageAttachmentLife.find({storageId, unitName});
  if (it == storageAttachmentLife.end()) return notFound("storage attachment " + storageId);
  if (Status st = begin("storage.removeAttachment " + storageId + " " + unitName); !st) return st;
  storageAttachmentLife.erase(it);
  return {};
}

Status FakeWorld::destroyUnitStorageAttachments(const std::string& unitName) {
  if (Status st = begin("storage.destroyUnitAttachments " + unitName); !st) return st;
  for (auto& [key, life] : storageAttachmentLife) {
    if (key.second == unitName && life == Life::Alive) life = Life::Dying;
  }
  return {};
}

Result<std::vector<state::FilesystemAttachment>> FakeWorld::filesystemAttachments(const Tag& host) const {
  if (Status st = check("filesystem.attachments " + host.str()); !st) return st.error();
  std::vector<state::FilesystemAttachment> out;
  for (const auto& [key, life] : filesystemAttachmentLife) {
    if (key.first == host) out.push_back({key.second, key.first});
  }
  return out;
}

Result<std::vector<state::FilesystemAttachment>> FakeWorld::filesystemAttachmentsFor(const std::string& filesystemId) const {
  std::vector<state::FilesystemAttachment> out;
  for (const auto& [key, life] : filesystemAttachmentLife) {
    if (key.second == filesystemId) out.push_back({key.second, key.first});
  }
  return out;
}

Result<std::vector<state::FilesystemInfo>> FakeWorld::hostFilesystems(const Tag& host) const {
  if (Status st = check("filesystem.host " + host.str()); !st) return st.error();
  std::vector<state::FilesystemInfo> out;
  for (const auto& [id, f] : filesystems) {
    if (f.hostScope && *f.hostScope == host) out.push_back({id, f.volumeId});
  }
  return out;
}

Result<state::FilesystemInfo> FakeWorld::filesystem(const std::string& filesystemId) const {
  auto it = filesystems.find(filesystemId);
  if (it == filesystems.end()) return notFound("filesystem " + filesystemId);
  return state::FilesystemInfo{filesystemId, it->second.volumeId};
}

Result<bool> FakeWorld::isDetachableFilesystem(const std::string& filesystemId) const {
  if (Status st = check("filesystem.isDetachable " + filesystemId); !st) return st.error();
  auto it = filesystems.find(filesystemId);
  if (it == filesystems.end()) return notFound("filesystem " + filesystemId);
  return it->second.detachable;
}

Status FakeWorld::destroyFilesystem(const std::string& filesystemId) {
  auto it = filesystems.find(filesystemId);
  if (it == filesystems.end()) return notFound("filesystem " + filesystemId);
  if (Status st = begin("filesystem.destroy " + filesystemId); !st) return st;
  if (it->second.life == Life::Alive) it->second.life = Life::Dying;
  return {};
}

Status FakeWorld::removeFilesystem(const std::string& filesystemId) {
  auto it = filesystems.find(filesystemId);
  if (it == filesystems.end()) return notFound("filesystem " + filesystemId);
  if (Status st = begin("filesystem.remove " + filesystemId); !st) return st;
  filesystems.erase(it);
  for (auto a = filesystemAttachmentLife.begin(); a != filesystemAttachmentLife.end();) {
    if (a->first.second == filesystemId) a = filesystemAttachmentLife.erase(a);
    else ++a;
  }
  return {};
}

Status FakeWorld::detachFilesystem(const Tag& host, const std::string& filesystemId) {
  auto it = filesystemAttachmentLife.find({host, filesystemId});
  if (it == filesystemAttachmentLife.end()) return notFound("filesystem attachment " + filesystemId);
  if (Status st = begin("filesystem.detach " + host.str() + " " + filesystemId); !st) return st;
  if (it->second == Life::Alive) it->second = Life::Dying;
  return {};
}

Status FakeWorld::removeFilesystemAttachment(const Tag& host, const std::string& filesystemId) {
  auto it = filesystemAttachmentLife.find({host, filesystemId});
  if (it == filesystemAttachmentLife.end()) return notFound("filesystem attachment " + filesystemId);
  if (Status st = begin("filesystem.removeAttachment " + host.str() + " " + filesystemId); !st) return st;
  filesystemAttachmentLife.erase(it);
  return {};
}

Status FakeWorld::setFilesystemDetached(const std::string& filesystemId) {
  auto it = filesystems.find(filesystemId);
  if (it == filesystems.end()) return notFound("filesystem " + filesystemId);
  if (Status st = begin("filesystem.setDetached " + filesystemId); !st) return st;
  it->second.markedDetached = true;
  return {};
}

Result<std::vector<state::VolumeAttachment>> FakeWorld::volumeAttachments(const Tag& host) const {
  if (Status st = check("volume.attachments " + host.str()); !st) return st.error();
  std::vector<state::VolumeAttachment> out;
  for (const auto& [key, life] : volumeAttachmentLife) {
    if (key.first == host) out.push_back({key.second, key.first});
  }
  return out;
}

Result<std::vector<state::VolumeAttachment>> FakeWorld::volumeAttachmentsFor(const std::string& volumeId) const {
  std::vector<state::VolumeAttachment> out;
  for (const auto& [key, life] : volumeAttachmentLife) {
    if (key.second == volumeId) out.push_back({key.second, key.first});
  }
  return out;
}

Result<bool> FakeWorld::isDetachableVolume(const std::string& volumeId) const {
  auto it = volumes.find(volumeId);
  if (it == volumes.end()) return notFound("volume " + volumeId);
  return it->second.detachable;
}

Status FakeWorld::detachVolume(const Tag& host, const std::string& volumeId) {
  auto it = volumeAttachmentLife.find({host, volumeId});
  if (it == volumeAttachmentLife.end()) return notFound("volume attachment " + volumeId);
  for (const auto& [id, f] : filesystems) {
    if (f.volumeId && *f.volumeId == volumeId) {
      return makeError(Errc::ContainsFilesystem, "volume contains filesystem " + id, volumeId);
    }
  }
  if (Status st = begin("volume.detach " + host.str() + " " + volumeId); !st) return st;
  if (it->second == Life::Alive) it->second = Life::Dying;
  return {};
}

Status FakeWorld::removeVolumeAttachmentPlan(const Tag& host, const std::string& volumeId) {
  auto it = volumePlans.find({host, volumeId});
  if (it == volumePlans.end()) return notFound("volume attachment plan " + volumeId);
  if (Status st = begin("volume.removePlan " + host.str() + " " + volumeId); !st) return st;
  volumePlans.erase(it);
  return {};
}

} // namespace reclaim::fake
