#pragma once

#include <string>
#include <tuple>
#include <utility>

namespace reclaim::state {

enum class Life { Alive, Dying, Dead };

inline const char* toString(Life l) {
  switch (l) {
    case Life::Alive: return "alive";
    case Life::Dying: return "dying";
    case Life::Dead:  return "dead";
  }
  return "alive";
}

// Identifies a storage host: either a machine or a unit.
struct Tag {
  enum class Kind { Machine, Unit };

  Kind kind = Kind::Machine;
  std::string id;

  static Tag machine(std::string id) { return Tag{Kind::Machine, std::move(id)}; }
  static Tag unit(std::string name)  { return Tag{Kind::Unit, std::move(name)}; }

  std::string str() const { return (kind == Kind::Machine ? "machine-" : "unit-") + id; }

  bool operator==(const Tag& o) const { return kind == o.kind && id == o.id; }
  bool operator!=(const Tag& o) const { return !(*this == o); }
  bool operator<(const Tag& o) const { return std::tie(kind, id) < std::tie(o.kind, o.id); }
};

} // namespace reclaim::state
