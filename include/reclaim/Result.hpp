#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace reclaim {

enum class Errc {
  NotFound,
  HasSubordinates,
  HasStorageAttachments,
  ContainsFilesystem,
  CharmInUse,
  InvalidArgument,
  UnknownKind,
  TxnAborted,
  NoOperations,
  Unavailable,
  Internal
};

const char* toString(Errc code);

struct Error {
  Errc code = Errc::Internal;
  std::string message;
  std::string path;   // entity or record the error refers to, may be empty

  std::string describe() const {
    if (path.empty()) return message;
    return path + ": " + message;
  }
};

inline Error makeError(Errc code, std::string message, std::string path = {}) {
  return Error{code, std::move(message), std::move(path)};
}

// Prefixes context onto the message; the code is kept so callers can still
// test for NotFound and friends after annotation.
inline Error annotate(Error err, const std::string& context) {
  err.message = context + ": " + err.message;
  return err;
}

class Status {
public:
  Status() = default;
  Status(const Error& error) : _error(error) {}
  Status(Error&& error) : _error(std::move(error)) {}

  bool ok() const { return !_error.has_value(); }
  explicit operator bool() const { return ok(); }

  bool is(Errc code) const { return _error && _error->code == code; }

  const Error& error() const { return *_error; }

  std::string describe() const { return ok() ? "ok" : _error->describe(); }

private:
  std::optional<Error> _error;
};

inline Status annotate(const Status& st, const std::string& context) {
  if (st.ok()) return st;
  return annotate(st.error(), context);
}

inline bool isNotFound(const Status& st) { return st.is(Errc::NotFound); }

template <typename T>
class Result {
public:
  Result(const T& value) : _value(value) {}
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Error& error) : _value(error) {}
  Result(Error&& error) : _value(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Error& error() const { return std::get<Error>(_value); }

  Status status() const { return has_value() ? Status{} : Status{error()}; }
  bool is(Errc code) const { return !has_value() && error().code == code; }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

private:
  std::variant<T, Error> _value;
};

// Warnings collected while a forced operation pushes past failures.
class Diagnostics {
public:
  void add(Error err) { _errors.push_back(std::move(err)); }
  void add(const Status& st) { if (!st.ok()) _errors.push_back(st.error()); }
  void merge(const Diagnostics& other) {
    _errors.insert(_errors.end(), other._errors.begin(), other._errors.end());
  }

  bool empty() const { return _errors.empty(); }
  std::size_t size() const { return _errors.size(); }
  const std::vector<Error>& errors() const { return _errors; }

  std::string describe() const;

private:
  std::vector<Error> _errors;
};

// Outcome of DestroyWithForce / RemoveWithForce style operations: the
// primary status plus everything that was overridden along the way.
struct Forced {
  Status status;
  Diagnostics diagnostics;
};

} // namespace reclaim
