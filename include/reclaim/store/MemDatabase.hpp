#pragma once

#include "reclaim/store/Database.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace reclaim::store {

// Document collections held in memory. When opened with a snapshot path the
// whole database is rewritten to that file after every commit and reloaded
// on open, so pending work survives a restart.
class MemDatabase final : public Database {
public:
  MemDatabase() = default;

  static Result<std::unique_ptr<MemDatabase>> open(const std::string& snapshotPath);

  Status runTransaction(const std::vector<TxnOp>& ops) override;
  Result<std::vector<Document>> find(const std::string& collection) const override;
  Result<std::size_t> count(const std::string& collection) const override;

  const std::string& snapshotPath() const { return path_; }

private:
  using Collection = std::map<std::string, std::string>;   // id -> JSON
  using Collections = std::map<std::string, Collection>;

  Status load();
  Status save(const Collections& data) const;

  mutable std::mutex mx_;
  Collections data_;
  std::string path_;
};

} // namespace reclaim::store
