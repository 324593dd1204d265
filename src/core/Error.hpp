#pragma once
#include <stdexcept>
#include <string>

namespace ifs {

enum class ErrorKind {
  Validation,
  NotFound,
  Conflict,
  IOFailure,
  PersistenceFailure,
  PermissionDenied
};

const char* errorKindName(ErrorKind kind);

// HTTP status the API layer answers with for a given kind.
int httpStatusFor(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

  static Error validation(const std::string& m)  { return Error(ErrorKind::Validation, m); }
  static Error notFound(const std::string& m)    { return Error(ErrorKind::NotFound, m); }
  static Error conflict(const std::string& m)    { return Error(ErrorKind::Conflict, m); }
  static Error io(const std::string& m)          { return Error(ErrorKind::IOFailure, m); }
  static Error persistence(const std::string& m) { return Error(ErrorKind::PersistenceFailure, m); }
  static Error permission(const std::string& m)  { return Error(ErrorKind::PermissionDenied, m); }

private:
  ErrorKind kind_;
};

} // namespace ifs
