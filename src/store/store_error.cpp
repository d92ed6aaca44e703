#include "store/store_error.hpp"

namespace chunkvault {

StoreError::StoreError(Kind kind, const std::string &message)
    : std::runtime_error(std::string(kindName(kind)) + " error: " + message),
      kind_(kind) {}

const char *StoreError::kindName(Kind kind) noexcept {
  switch (kind) {
  case Kind::Integrity:
    return "integrity";
  case Kind::Io:
    return "I/O";
  case Kind::Metadata:
    return "metadata";
  case Kind::Config:
    return "configuration";
  case Kind::InvalidArgument:
    return "invalid argument";
  }
  return "unknown";
}

} // namespace chunkvault
