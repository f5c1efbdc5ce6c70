#include "reclaim/Result.hpp"

#include <sstream>

namespace reclaim {

const char* toString(Errc code) {
  switch (code) {
    case Errc::NotFound:              return "not found";
    case Errc::HasSubordinates:       return "has subordinates";
    case Errc::HasStorageAttachments: return "has storage attachments";
    case Errc::ContainsFilesystem:    return "contains filesystem";
    case Errc::CharmInUse:            return "charm in use";
    case Errc::InvalidArgument:       return "invalid argument";
    case Errc::UnknownKind:           return "unknown kind";
    case Errc::TxnAborted:            return "transaction aborted";
    case Errc::NoOperations:          return "no operations";
    case Errc::Unavailable:           return "unavailable";
    case Errc::Internal:              return "internal";
  }
  return "internal";
}

std::string Diagnostics::describe() const {
  std::ostringstream oss;
  oss << '[';
  for (std::size_t i = 0; i < _errors.size(); ++i) {
    if (i) oss << "; ";
    oss << _errors[i].describe();
  }
  oss << ']';
  return oss.str();
}

} // namespace reclaim
