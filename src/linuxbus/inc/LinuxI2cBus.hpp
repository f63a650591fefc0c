#ifndef REGIFACE_LINUXBUS_LINUX_I2C_BUS_HPP
#define REGIFACE_LINUXBUS_LINUX_I2C_BUS_HPP
/**
 * @file LinuxI2cBus.hpp
 * @brief Blocking I2C driver over the Linux i2c-dev interface.
 * @note Linux-only. Uses /dev/i2c-N and the I2C_RDWR ioctl.
 * @note Not thread-safe: One caller per instance. The kernel serializes
 *       transfers from different file descriptors on the same adapter.
 *
 * Every writeRead() and transaction() is issued as a single I2C_RDWR ioctl,
 * so the kernel performs it as one combined transfer (repeated start between
 * messages, one stop at the end). Adjacent operations of the same direction
 * are merged into one message so no restart separates them, and zero-length
 * operations are dropped.
 *
 * @code
 * auto bus = linuxbus::LinuxI2cBus::open(1);
 * if (bus) {
 *   auto temp = i2c::blocking::readRegister<Temperature>(bus.value(), 0x48);
 * }
 * @endcode
 */

#include "src/bus/inc/I2cBus.hpp"
#include "src/bus/inc/Operation.hpp"
#include "src/linuxbus/inc/LinuxBusError.hpp"

#include <etl/expected.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace regiface {

namespace linuxbus {

/* ----------------------------- Constants ----------------------------- */

/// Kernel limit on messages per I2C_RDWR call (I2C_RDWR_IOCTL_MAX_MSGS).
inline constexpr std::size_t I2C_MAX_MESSAGES = 42;

/// Character device directory for i2c-dev nodes.
inline constexpr const char* I2C_DEV_DIR = "/dev";

/* ----------------------------- Segmentation ----------------------------- */

/**
 * @brief Run of adjacent same-direction operations sent as one i2c_msg.
 */
struct I2cSegment {
  bus::OperationType type{bus::OperationType::WRITE};
  std::size_t first{0};  ///< Index of the first operation in the run
  std::size_t last{0};   ///< Index of the last operation in the run (inclusive)
  std::size_t length{0}; ///< Total bytes across the run
  std::size_t parts{0};  ///< Non-empty operations merged into this segment
};

/**
 * @brief Message layout for one transaction.
 */
struct I2cSegmentList {
  std::array<I2cSegment, I2C_MAX_MESSAGES> segments{};
  std::size_t count{0};
  bool overflow{false}; ///< More than I2C_MAX_MESSAGES segments were needed

  [[nodiscard]] std::span<const I2cSegment> view() const noexcept {
    return {segments.data(), count};
  }
};

/**
 * @brief Group operations into kernel messages.
 * @param ops Transaction steps, in order.
 * @return Segments in order; empty operations are skipped and same-direction
 *         neighbours are merged.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] I2cSegmentList segmentOperations(std::span<const bus::Operation> ops) noexcept;

/* ----------------------------- Path Helpers ----------------------------- */

/**
 * @brief Device node for an adapter number.
 * @return "/dev/i2c-<busNumber>".
 */
[[nodiscard]] std::string i2cDevicePath(std::uint32_t busNumber);

/**
 * @brief Parse an adapter number from "N", "i2c-N" or "/dev/i2c-N".
 * @param name Input string.
 * @param outBusNumber Receives the number on success.
 * @return true if a number was parsed.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] bool parseI2cBusNumber(const char* name, std::uint32_t& outBusNumber) noexcept;

/* ----------------------------- LinuxI2cBus ----------------------------- */

/**
 * @brief Owning handle on one i2c-dev adapter.
 *
 * Satisfies bus::I2cBus for both bus::SevenBitAddress and bus::TenBitAddress.
 * Move-only; the file descriptor is closed on destruction.
 */
class LinuxI2cBus {
public:
  using Error = LinuxBusError;

  /**
   * @brief Open /dev/i2c-<busNumber>.
   * @note NOT RT-safe: Allocates the path and calls open().
   */
  [[nodiscard]] static etl::expected<LinuxI2cBus, LinuxBusError> open(std::uint32_t busNumber);

  /**
   * @brief Open the adapter named "N", "i2c-N" or "/dev/i2c-N".
   * @return INVALID_ARGUMENT when no adapter number can be parsed from `name`.
   * @note NOT RT-safe: Allocates the path and calls open().
   */
  [[nodiscard]] static etl::expected<LinuxI2cBus, LinuxBusError> openByName(const char* name);

  /**
   * @brief Open an explicit device node path.
   * @note NOT RT-safe: open() syscall.
   */
  [[nodiscard]] static etl::expected<LinuxI2cBus, LinuxBusError>
  openPath(const char* path) noexcept;

  LinuxI2cBus(const LinuxI2cBus&) = delete;
  LinuxI2cBus& operator=(const LinuxI2cBus&) = delete;
  LinuxI2cBus(LinuxI2cBus&& other) noexcept;
  LinuxI2cBus& operator=(LinuxI2cBus&& other) noexcept;
  ~LinuxI2cBus();

  /// @brief Write `out`, repeated start, read `in.size()` bytes.
  [[nodiscard]] etl::expected<void, Error> writeRead(bus::SevenBitAddress addr,
                                                     std::span<const std::uint8_t> out,
                                                     std::span<std::uint8_t> in);

  /// @brief 10-bit variant of writeRead().
  [[nodiscard]] etl::expected<void, Error> writeRead(bus::TenBitAddress addr,
                                                     std::span<const std::uint8_t> out,
                                                     std::span<std::uint8_t> in);

  /// @brief Execute all operations as one combined transfer.
  [[nodiscard]] etl::expected<void, Error> transaction(bus::SevenBitAddress addr,
                                                       std::span<bus::Operation> ops);

  /// @brief 10-bit variant of transaction().
  [[nodiscard]] etl::expected<void, Error> transaction(bus::TenBitAddress addr,
                                                       std::span<bus::Operation> ops);

  /// @brief Underlying file descriptor (-1 after move).
  [[nodiscard]] int fd() const noexcept { return fd_; }

private:
  explicit LinuxI2cBus(int fd) noexcept : fd_(fd) {}

  etl::expected<void, Error> transfer(std::uint16_t addr, bool tenBit,
                                      std::span<bus::Operation> ops);

  int fd_{-1};
};

} // namespace linuxbus

} // namespace regiface

#endif // REGIFACE_LINUXBUS_LINUX_I2C_BUS_HPP
