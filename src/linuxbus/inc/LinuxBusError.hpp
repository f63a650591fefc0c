#ifndef REGIFACE_LINUXBUS_LINUX_BUS_ERROR_HPP
#define REGIFACE_LINUXBUS_LINUX_BUS_ERROR_HPP
/**
 * @file LinuxBusError.hpp
 * @brief Error type reported by the Linux i2c-dev and spidev drivers.
 * @note Thread-safe: Plain value type.
 */

#include <cstdint>
#include <string>

namespace regiface {

namespace linuxbus {

/* ----------------------------- LinuxBusStatus ----------------------------- */

/**
 * @brief Failure reason of a Linux bus call.
 */
enum class LinuxBusStatus : std::uint8_t {
  OPEN_FAILED = 0,   ///< open() of the device node failed
  CONFIG_FAILED,     ///< Configuration ioctl rejected
  INVALID_ARGUMENT,  ///< Bad bus number, address or path
  TOO_MANY_MESSAGES, ///< Transaction exceeds the kernel message limit
  TRANSFER_FAILED,   ///< I2C_RDWR or SPI_IOC_MESSAGE failed
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns static string pointer.
 */
[[nodiscard]] const char* toString(LinuxBusStatus status) noexcept;

/* ----------------------------- LinuxBusError ----------------------------- */

/**
 * @brief Status plus the errno captured at the failing call (0 if none).
 */
struct LinuxBusError {
  LinuxBusStatus status{LinuxBusStatus::TRANSFER_FAILED};
  int errnum{0};

  /// @brief Human-readable summary (e.g., "TRANSFER_FAILED (errno 121: Remote I/O error)").
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

} // namespace linuxbus

} // namespace regiface

#endif // REGIFACE_LINUXBUS_LINUX_BUS_ERROR_HPP
