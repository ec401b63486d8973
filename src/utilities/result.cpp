#include "utilities/result.hpp"

namespace docforensics {

std::string toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::PersistenceError:
    return "PersistenceError";
  case ErrorKind::EncryptionError:
    return "EncryptionError";
  case ErrorKind::SessionNotFound:
    return "SessionNotFound";
  case ErrorKind::DocumentNotFound:
    return "DocumentNotFound";
  case ErrorKind::ChainCorruption:
    return "ChainCorruption";
  case ErrorKind::UnreadableLedger:
    return "UnreadableLedger";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::UnsupportedFormat:
    return "UnsupportedFormat";
  default:
    return "Unknown";
  }
}

} // namespace docforensics
