/**
 * @file LinuxBusError.cpp
 * @brief Status strings for the Linux bus drivers.
 */

#include "src/linuxbus/inc/LinuxBusError.hpp"

#include <cstring>

#include <fmt/core.h>

namespace regiface {

namespace linuxbus {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(LinuxBusStatus status) noexcept {
  switch (status) {
  case LinuxBusStatus::OPEN_FAILED:
    return "OPEN_FAILED";
  case LinuxBusStatus::CONFIG_FAILED:
    return "CONFIG_FAILED";
  case LinuxBusStatus::INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case LinuxBusStatus::TOO_MANY_MESSAGES:
    return "TOO_MANY_MESSAGES";
  case LinuxBusStatus::TRANSFER_FAILED:
    return "TRANSFER_FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- LinuxBusError Methods ----------------------------- */

std::string LinuxBusError::toString() const {
  if (errnum == 0) {
    return linuxbus::toString(status);
  }
  return fmt::format("{} (errno {}: {})", linuxbus::toString(status), errnum,
                     std::strerror(errnum));
}

} // namespace linuxbus

} // namespace regiface
