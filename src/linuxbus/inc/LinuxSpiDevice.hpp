#ifndef REGIFACE_LINUXBUS_LINUX_SPI_DEVICE_HPP
#define REGIFACE_LINUXBUS_LINUX_SPI_DEVICE_HPP
/**
 * @file LinuxSpiDevice.hpp
 * @brief Blocking SPI driver over the Linux spidev interface.
 * @note Linux-only. Uses /dev/spidevB.C and the SPI_IOC_MESSAGE ioctl.
 * @note Not thread-safe: One caller per instance.
 *
 * A transaction is submitted as one SPI_IOC_MESSAGE request with one transfer
 * per non-empty operation. Chip select stays asserted from the first transfer
 * to the last, so the device sees a single framed exchange.
 */

#include "src/bus/inc/Operation.hpp"
#include "src/bus/inc/SpiBus.hpp"
#include "src/linuxbus/inc/LinuxBusError.hpp"

#include <etl/expected.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace regiface {

namespace linuxbus {

/* ----------------------------- Constants ----------------------------- */

/// Maximum operations submitted in one SPI_IOC_MESSAGE request.
inline constexpr std::size_t SPI_MAX_TRANSFERS = 16;

/// Character device directory for spidev nodes.
inline constexpr const char* SPI_DEV_DIR = "/dev";

/* ----------------------------- SpiMode ----------------------------- */

/**
 * @brief SPI mode (CPOL/CPHA).
 *
 * Mode | CPOL | CPHA | Clock Idle | Data Capture
 * -----|------|------|------------|-------------
 *  0   |  0   |  0   | Low        | Rising edge
 *  1   |  0   |  1   | Low        | Falling edge
 *  2   |  1   |  0   | High       | Falling edge
 *  3   |  1   |  1   | High       | Rising edge
 */
enum class SpiMode : std::uint8_t {
  MODE_0 = 0, ///< CPOL=0, CPHA=0
  MODE_1 = 1, ///< CPOL=0, CPHA=1
  MODE_2 = 2, ///< CPOL=1, CPHA=0
  MODE_3 = 3, ///< CPOL=1, CPHA=1
};

/// @brief Convert SpiMode to string (e.g., "mode0").
[[nodiscard]] const char* toString(SpiMode mode) noexcept;

/* ----------------------------- SpiConfig ----------------------------- */

/**
 * @brief Settings applied to the device when it is opened.
 */
struct SpiConfig {
  SpiMode mode{SpiMode::MODE_0};  ///< Clock polarity and phase
  std::uint8_t bitsPerWord{8};    ///< Bits per word
  std::uint32_t speedHz{1000000}; ///< Clock speed in Hz (0 keeps the driver default)
  bool lsbFirst{false};           ///< LSB first (vs MSB first)
  bool csHigh{false};             ///< Chip select active high
  std::uint16_t delayUsecs{0};    ///< Delay after each transfer

  /// @brief Mode byte for SPI_IOC_WR_MODE (mode bits plus flags).
  [[nodiscard]] std::uint8_t modeBits() const noexcept;

  /// @brief Human-readable summary.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Path Helpers ----------------------------- */

/**
 * @brief Device node for a bus and chip select.
 * @return "/dev/spidev<bus>.<chipSelect>".
 */
[[nodiscard]] std::string spiDevicePath(std::uint32_t bus, std::uint32_t chipSelect);

/* ----------------------------- LinuxSpiDevice ----------------------------- */

/**
 * @brief Owning handle on one spidev chip select.
 *
 * Satisfies bus::SpiDevice. Move-only; the file descriptor is closed on
 * destruction.
 */
class LinuxSpiDevice {
public:
  using Error = LinuxBusError;

  /**
   * @brief Open /dev/spidev<bus>.<chipSelect> and apply `config`.
   * @note NOT RT-safe: Allocates the path, then open() and configuration ioctls.
   */
  [[nodiscard]] static etl::expected<LinuxSpiDevice, LinuxBusError>
  open(std::uint32_t bus, std::uint32_t chipSelect, const SpiConfig& config = {});

  /**
   * @brief Open an explicit device node path and apply `config`.
   * @note NOT RT-safe: open() and configuration ioctls.
   */
  [[nodiscard]] static etl::expected<LinuxSpiDevice, LinuxBusError>
  openPath(const char* path, const SpiConfig& config = {}) noexcept;

  LinuxSpiDevice(const LinuxSpiDevice&) = delete;
  LinuxSpiDevice& operator=(const LinuxSpiDevice&) = delete;
  LinuxSpiDevice(LinuxSpiDevice&& other) noexcept;
  LinuxSpiDevice& operator=(LinuxSpiDevice&& other) noexcept;
  ~LinuxSpiDevice();

  /// @brief Execute all operations with chip select held.
  /// @note RT-safe: No allocation, single ioctl.
  [[nodiscard]] etl::expected<void, Error> transaction(std::span<bus::Operation> ops) noexcept;

  [[nodiscard]] const SpiConfig& config() const noexcept { return config_; }

  /// @brief Underlying file descriptor (-1 after move).
  [[nodiscard]] int fd() const noexcept { return fd_; }

private:
  LinuxSpiDevice(int fd, const SpiConfig& config) noexcept : fd_(fd), config_(config) {}

  int fd_{-1};
  SpiConfig config_{};
};

} // namespace linuxbus

} // namespace regiface

#endif // REGIFACE_LINUXBUS_LINUX_SPI_DEVICE_HPP
