/**
 * @file LinuxI2cBus.cpp
 * @brief i2c-dev driver: message layout and I2C_RDWR transfers.
 */

#include "src/linuxbus/inc/LinuxI2cBus.hpp"

#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace regiface {

namespace linuxbus {

namespace {

/* ----------------------------- Constants ----------------------------- */

/// i2c_msg::len is 16 bits wide.
constexpr std::size_t I2C_MAX_MESSAGE_LENGTH = 0xFFFF;

/* ----------------------------- Helpers ----------------------------- */

inline const std::uint8_t* operationData(const bus::Operation& op) noexcept {
  return op.isWrite() ? op.writeData.data() : op.readBuffer.data();
}

} // anonymous namespace

/* ----------------------------- Segmentation ----------------------------- */

I2cSegmentList segmentOperations(std::span<const bus::Operation> ops) noexcept {
  I2cSegmentList list{};

  for (std::size_t i = 0; i < ops.size(); ++i) {
    const bus::Operation& OP = ops[i];
    if (OP.size() == 0) {
      continue;
    }

    if (list.count > 0 && list.segments[list.count - 1].type == OP.type) {
      I2cSegment& seg = list.segments[list.count - 1];
      seg.last = i;
      seg.length += OP.size();
      ++seg.parts;
      continue;
    }

    if (list.count == I2C_MAX_MESSAGES) {
      list.overflow = true;
      return list;
    }

    list.segments[list.count] = I2cSegment{OP.type, i, i, OP.size(), 1};
    ++list.count;
  }

  return list;
}

/* ----------------------------- Path Helpers ----------------------------- */

std::string i2cDevicePath(std::uint32_t busNumber) {
  return fmt::format("{}/i2c-{}", I2C_DEV_DIR, busNumber);
}

bool parseI2cBusNumber(const char* name, std::uint32_t& outBusNumber) noexcept {
  if (name == nullptr || name[0] == '\0') {
    return false;
  }

  const char* ptr = name;
  if (std::strncmp(ptr, "/dev/", 5) == 0) {
    ptr += 5;
  }
  if (std::strncmp(ptr, "i2c-", 4) == 0) {
    ptr += 4;
  }

  if (*ptr < '0' || *ptr > '9') {
    return false;
  }

  errno = 0;
  char* endPtr = nullptr;
  const unsigned long VAL = std::strtoul(ptr, &endPtr, 10);
  if (endPtr == ptr || errno == ERANGE || VAL > UINT32_MAX) {
    return false;
  }

  // Trailing whitespace from sysfs reads is tolerated
  if (*endPtr != '\0' && *endPtr != ' ' && *endPtr != '\n') {
    return false;
  }

  outBusNumber = static_cast<std::uint32_t>(VAL);
  return true;
}

/* ----------------------------- LinuxI2cBus Methods ----------------------------- */

etl::expected<LinuxI2cBus, LinuxBusError> LinuxI2cBus::open(std::uint32_t busNumber) {
  const std::string PATH = i2cDevicePath(busNumber);
  return openPath(PATH.c_str());
}

etl::expected<LinuxI2cBus, LinuxBusError> LinuxI2cBus::openByName(const char* name) {
  std::uint32_t busNumber = 0;
  if (!parseI2cBusNumber(name, busNumber)) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, 0});
  }
  return open(busNumber);
}

etl::expected<LinuxI2cBus, LinuxBusError> LinuxI2cBus::openPath(const char* path) noexcept {
  if (path == nullptr || path[0] == '\0') {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, 0});
  }

  const int FD = ::open(path, O_RDWR | O_CLOEXEC);
  if (FD < 0) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::OPEN_FAILED, errno});
  }
  return LinuxI2cBus(FD);
}

LinuxI2cBus::LinuxI2cBus(LinuxI2cBus&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

LinuxI2cBus& LinuxI2cBus::operator=(LinuxI2cBus&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

LinuxI2cBus::~LinuxI2cBus() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

etl::expected<void, LinuxBusError> LinuxI2cBus::writeRead(bus::SevenBitAddress addr,
                                                          std::span<const std::uint8_t> out,
                                                          std::span<std::uint8_t> in) {
  std::array<bus::Operation, 2> ops{bus::Operation::write(out), bus::Operation::read(in)};
  return transaction(addr, ops);
}

etl::expected<void, LinuxBusError> LinuxI2cBus::writeRead(bus::TenBitAddress addr,
                                                          std::span<const std::uint8_t> out,
                                                          std::span<std::uint8_t> in) {
  std::array<bus::Operation, 2> ops{bus::Operation::write(out), bus::Operation::read(in)};
  return transaction(addr, ops);
}

etl::expected<void, LinuxBusError> LinuxI2cBus::transaction(bus::SevenBitAddress addr,
                                                            std::span<bus::Operation> ops) {
  if (addr > bus::SEVEN_BIT_ADDR_MAX) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, 0});
  }
  return transfer(addr, false, ops);
}

etl::expected<void, LinuxBusError> LinuxI2cBus::transaction(bus::TenBitAddress addr,
                                                            std::span<bus::Operation> ops) {
  if (addr > bus::TEN_BIT_ADDR_MAX) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, 0});
  }
  return transfer(addr, true, ops);
}

etl::expected<void, LinuxBusError> LinuxI2cBus::transfer(std::uint16_t addr, bool tenBit,
                                                         std::span<bus::Operation> ops) {
  if (fd_ < 0) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, EBADF});
  }

  const I2cSegmentList LAYOUT = segmentOperations(ops);
  if (LAYOUT.overflow) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::TOO_MANY_MESSAGES, 0});
  }
  if (LAYOUT.count == 0) {
    return {};
  }

  // Merged segments go through a scratch buffer; single ones use the caller's buffer
  std::size_t scratchSize = 0;
  for (const I2cSegment& SEG : LAYOUT.view()) {
    if (SEG.length > I2C_MAX_MESSAGE_LENGTH) {
      return etl::unexpected(LinuxBusError{LinuxBusStatus::INVALID_ARGUMENT, 0});
    }
    if (SEG.parts > 1) {
      scratchSize += SEG.length;
    }
  }
  std::vector<std::uint8_t> scratch(scratchSize);

  std::array<i2c_msg, I2C_MAX_MESSAGES> msgs{};
  std::array<std::size_t, I2C_MAX_MESSAGES> scratchAt{};
  std::size_t offset = 0;

  for (std::size_t s = 0; s < LAYOUT.count; ++s) {
    const I2cSegment& SEG = LAYOUT.segments[s];
    const bool IS_READ = SEG.type == bus::OperationType::READ;

    i2c_msg& msg = msgs[s];
    msg.addr = addr;
    msg.flags = static_cast<__u16>((tenBit ? I2C_M_TEN : 0) | (IS_READ ? I2C_M_RD : 0));
    msg.len = static_cast<__u16>(SEG.length);

    if (SEG.parts == 1) {
      for (std::size_t i = SEG.first; i <= SEG.last; ++i) {
        if (ops[i].size() > 0) {
          // The kernel only reads from write buffers
          msg.buf = const_cast<__u8*>(operationData(ops[i]));
          break;
        }
      }
      continue;
    }

    scratchAt[s] = offset;
    msg.buf = scratch.data() + offset;
    if (!IS_READ) {
      std::uint8_t* dst = msg.buf;
      for (std::size_t i = SEG.first; i <= SEG.last; ++i) {
        dst = std::copy(ops[i].writeData.begin(), ops[i].writeData.end(), dst);
      }
    }
    offset += SEG.length;
  }

  i2c_rdwr_ioctl_data request{};
  request.msgs = msgs.data();
  request.nmsgs = static_cast<__u32>(LAYOUT.count);

  if (::ioctl(fd_, I2C_RDWR, &request) < 0) {
    return etl::unexpected(LinuxBusError{LinuxBusStatus::TRANSFER_FAILED, errno});
  }

  // Scatter merged reads back to the caller's buffers
  for (std::size_t s = 0; s < LAYOUT.count; ++s) {
    const I2cSegment& SEG = LAYOUT.segments[s];
    if (SEG.parts == 1 || SEG.type != bus::OperationType::READ) {
      continue;
    }
    const std::uint8_t* src = scratch.data() + scratchAt[s];
    for (std::size_t i = SEG.first; i <= SEG.last; ++i) {
      std::span<std::uint8_t> dst = ops[i].readBuffer;
      std::copy(src, src + dst.size(), dst.begin());
      src += dst.size();
    }
  }

  return {};
}

} // namespace linuxbus

} // namespace regiface
