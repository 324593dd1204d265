#include "Error.hpp"

namespace ifs {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:         return "validation";
    case ErrorKind::NotFound:           return "not_found";
    case ErrorKind::Conflict:           return "conflict";
    case ErrorKind::IOFailure:          return "io_failure";
    case ErrorKind::PersistenceFailure: return "persistence_failure";
    case ErrorKind::PermissionDenied:   return "permission_denied";
  }
  return "unknown";
}

int httpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:       return 400;
    case ErrorKind::NotFound:         return 404;
    case ErrorKind::Conflict:         return 409;
    case ErrorKind::PermissionDenied: return 403;
    default:                          return 500;
  }
}

} // namespace ifs
