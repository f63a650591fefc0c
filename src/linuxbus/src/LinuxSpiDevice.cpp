/**
 * @file LinuxSpiDevice.cpp
 * @brief spidev driver: configuration and SPI_IOC_MESSAGE transfers.
 */

#include "src/linuxbus/inc/LinuxSpiDevice.hpp"

#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include <fmt/core.h>

namespace regiface {

namespace linuxbus {

namespace {

/* ----------------------------- SPI Helpers ----------------------------- */

/**
 * SPI_IOC_MESSAGE(n) for a runtime count.
 */
inline unsigned long messageRequest(std::size_t count) noexcept {
  return _IOC(_IOC_WRITE, SPI_IOC_MAGIC, 0, SPI_MSGSIZE(count));
}

/**
 * Apply mode, word size and speed. Returns the errno of the first failure, 0 on success.
 */
inline int applyConfig(int fd, const SpiConfig& cfg) noexcept {
  std::uint8_t mode = cfg.modeBits();
  if (::ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0) {
    return errno;
  }

  std::uint8_t bits = cfg.bitsPerWord;
  if (::ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0) {
    return errno;
  }

  if (cfg.speedHz != 0) {
    std::uint32_t speed = cfg.speedHz;
    if (::ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
      return errno;
    }
  }

  return 0;
}

} // anonymous namespace

/* ----------------------------- SpiMode ----------------------------- */

const char* toString(SpiMode mode) noexcept {
  switch (mode) {
  case SpiMode::MODE_0:
    return "mode0";
  case SpiMode::MODE_1:
    return "mode1";
  case SpiMode::MODE_2:
    return "mode2";
  case SpiMode::MODE_3:
    return "mode3";
  }
  return "unknown";
}

/* ----------------------------- SpiConfig Methods ----------------------------- */

std::uint8_t SpiConfig::modeBits() const noexcept {
  std::uint8_t bits = static_cast<std::uint8_t>(static_cast<std::uint8_t>(mode) & 0x03U);
  if (lsbFirst) {
    bits = static_cast<std::uint8_t>(bits | SPI_LSB_FIRST);
  }
  if (csHigh) {
    bits = static_cast<std::uint8_t>(bits | SPI_CS_HIGH);
  }
  return bits;
}

std::string SpiConfig::toString() const {
  std::string out =
      fmt::format("{}, {} bits, {} Hz", linuxbus::toString(mode), bitsPerWord, speedHz);
  if (lsbFirst) {
    out += ", lsb-first";
  }
  if (csHigh) {
    out += ", cs-high";
  }
  if (delayUsecs != 0) {
    out += fmt::format(", {} us delay", delayUsecs);
  }
  return out;
}

/* ----------------------------- Path Helpers ----------------------------- */

std::string spiDevicePath(std::uint32_t bus, std::uint32_t chipSelect) {
  return fmt::format("{}/spidev{}.{}", SPI_DEV_DIR, bus, chipSelect);
}

/* ----------------------------- LinuxSpiDevice Methods ----------------------------- */

etl::expected<LinuxSpiDevice, LinuxBusError>
LinuxSpiDevice::open(std::uint32_t bus, std::uint32_t chipSelect, const SpiConfig& config) {
  const std::string PATH = spiDevicePath(bus, chipSelect);
  return openPath(PATH.c_str(), config);
}

etl::expected<LinuxSpiDevice, LinuxBusError>
LinuxSpiDevice::openPath(const char* path, const SpiConfig& config) noexcept {
  if (path == nullptr || path[0] == '\0' || config.bitsPerWord == 0) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, 0});
  }

  const int FD = ::open(path, O_RDWR | O_CLOEXEC);
  if (FD < 0) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::OPEN_FAILED, errno});
  }

  const int CONFIG_ERR = applyConfig(FD, config);
  if (CONFIG_ERR != 0) {
    ::close(FD);
    return etl::unexpected(LinuxBusError{LinuxBusStatus::CONFIG_FAILED, CONFIG_ERR});
  }

  return LinuxSpiDevice(FD, config);
}

LinuxSpiDevice::LinuxSpiDevice(LinuxSpiDevice&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), config_(other.config_) {}

LinuxSpiDevice& LinuxSpiDevice::operator=(LinuxSpiDevice&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = std::exchange(other.fd_, -1);
    config_ = other.config_;
  }
  return *this;
}

LinuxSpiDevice::~LinuxSpiDevice() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

etl::expected<void, LinuxBusError>
LinuxSpiDevice::transaction(std::span<bus::Operation> ops) noexcept {
  if (fd_ < 0) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, EBADF});
  }

  std::array<spi_ioc_transfer, SPI_MAX_TRANSFERS> xfers{};
  std::size_t count = 0;

  for (const bus::Operation& OP : ops) {
    if (OP.size() == 0) {
      continue;
    }
    if (count == SPI_MAX_TRANSFERS) {
      return etl::unexpected(LinuxBusError{LinuxBusStatus::TOO_MANY_MESSAGES, 0});
    }

    spi_ioc_transfer& xfer = xfers[count++];
    if (OP.isWrite()) {
      xfer.tx_buf = reinterpret_cast<std::uintptr_t>(OP.writeData.data());
    } else {
      xfer.rx_buf = reinterpret_cast<std::uintptr_t>(OP.readBuffer.data());
    }
    xfer.len = static_cast<__u32>(OP.size());
    xfer.speed_hz = config_.speedHz;
    xfer.bits_per_word = config_.bitsPerWord;
    xfer.delay_usecs = config_.delayUsecs;
    xfer.cs_change = 0;
  }

  if (count == 0) {
    return {};
  }

  if (::ioctl(fd_, messageRequest(count), xfers.data()) < 0) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::TRANSFER_FAILED, errno});
  }
  return {};
}

} // namespace linuxbus

} // namespace regiface
