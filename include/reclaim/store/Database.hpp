#pragma once

#include "reclaim/Result.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace reclaim::store {

enum class Assert { None, DocExists, DocMissing };

// One step of a transaction. An insert implies the document is missing;
// a remove of a missing document is a no-op unless DocExists is asserted.
struct TxnOp {
  std::string collection;
  std::string id;
  Assert precondition = Assert::None;
  std::optional<std::string> insert;   // JSON object text
  bool remove = false;
};

struct Document {
  std::string id;
  std::string json;
};

// Builds the ops for one attempt; attempt 0 is the first try. Returning an
// error with Errc::NoOperations ends the run successfully.
using TxnSource = std::function<Result<std::vector<TxnOp>>(int attempt)>;

class Database {
public:
  static constexpr int kDefaultAttempts = 3;

  virtual ~Database() = default;

  /// Applies every op or none. A failed assert aborts with Errc::TxnAborted.
  virtual Status runTransaction(const std::vector<TxnOp>& ops) = 0;

  virtual Result<std::vector<Document>> find(const std::string& collection) const = 0;
  virtual Result<std::size_t> count(const std::string& collection) const = 0;

  /// Rebuilds and retries the transaction while it aborts.
  Status run(const TxnSource& source, int maxAttempts = kDefaultAttempts);
};

} // namespace reclaim::store
