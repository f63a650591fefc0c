/**
 * @file Operation.cpp
 * @brief Transaction step helpers.
 */

#include "src/bus/inc/Operation.hpp"
#include "src/core/inc/ByteArray.hpp"

#include <fmt/core.h>

namespace regiface {

namespace bus {

/* ----------------------------- OperationType ----------------------------- */

const char* toString(OperationType type) noexcept {
  switch (type) {
  case OperationType::WRITE:
    return "write";
  case OperationType::READ:
    return "read";
  }
  return "unknown";
}

/* ----------------------------- Operation Methods ----------------------------- */

Operation Operation::write(std::span<const std::uint8_t> data) noexcept {
  Operation op{};
  op.type = OperationType::WRITE;
  op.writeData = data;
  return op;
}

Operation Operation::read(std::span<std::uint8_t> buffer) noexcept {
  Operation op{};
  op.type = OperationType::READ;
  op.readBuffer = buffer;
  return op;
}

bool Operation::isWrite() const noexcept { return type == OperationType::WRITE; }

bool Operation::isRead() const noexcept { return type == OperationType::READ; }

std::size_t Operation::size() const noexcept {
  return isWrite() ? writeData.size() : readBuffer.size();
}

std::string Operation::toString() const {
  if (isWrite()) {
    return fmt::format("write {}", toHexString(writeData));
  }
  return fmt::format("read {} bytes", readBuffer.size());
}

} // namespace bus

} // namespace regiface
