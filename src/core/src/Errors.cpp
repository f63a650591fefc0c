/**
 * @file Errors.cpp
 * @brief ErrorKind string conversion.
 */

#include "src/core/inc/Errors.hpp"

namespace regiface {

/* ----------------------------- ErrorKind ----------------------------- */

const char* toString(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::BUS:
    return "bus error";
  case ErrorKind::SERIALIZATION:
    return "serialization error";
  case ErrorKind::DESERIALIZATION:
    return "deserialization error";
  }
  return "unknown error";
}

} // namespace regiface
