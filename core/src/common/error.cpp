#include "mbt/common/error.h"
#include <sstream>

namespace mbt {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Configuration:    return "configuration";
    case ErrorKind::Transient:        return "transient";
    case ErrorKind::RetriesExhausted: return "retries-exhausted";
    case ErrorKind::Integrity:        return "integrity";
    case ErrorKind::StaleResume:      return "stale-resume";
    case ErrorKind::Decryption:       return "decryption";
    case ErrorKind::Cancelled:        return "cancelled";
    case ErrorKind::Fatal:            return "fatal";
  }
  return "unknown";
}

Error Error::retries_exhausted(RetryExhaustion info) {
  std::ostringstream ss;
  ss << info.operation << " failed after " << info.attempts << " attempts in "
     << info.elapsed.count() << "ms";
  if (!info.last_error.empty()) ss << ": " << info.last_error;
  Error e;
  e.kind = ErrorKind::RetriesExhausted;
  e.message = ss.str();
  e.exhausted = std::move(info);
  return e;
}

std::string Error::describe() const {
  return std::string("[") + to_string(kind) + "] " + message;
}

} // namespace mbt
