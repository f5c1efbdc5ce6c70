#include "reclaim/store/Database.hpp"

#include "reclaim/util/Logger.hpp"

namespace reclaim::store {

Status Database::run(const TxnSource& source, int maxAttempts) {
  if (maxAttempts < 1) maxAttempts = 1;
  for (int attempt = 0; attempt < maxAttempts; ++attempt) {
    auto ops = source(attempt);
    if (!ops) {
      if (ops.is(Errc::NoOperations)) return {};
      return ops.error();
    }
    if (ops->empty()) return {};

    Status st = runTransaction(*ops);
    if (!st.is(Errc::TxnAborted)) return st;

    util::logger().log(util::LogLevel::Debug, "transaction aborted, retrying",
                       {{"attempt", std::to_string(attempt)}});
  }
  return makeError(Errc::TxnAborted, "transaction aborted after " +
                                     std::to_string(maxAttempts) + " attempts");
}

} // namespace reclaim::store
