#ifndef REGIFACE_BUS_OPERATION_HPP
#define REGIFACE_BUS_OPERATION_HPP
/**
 * @file Operation.hpp
 * @brief Single step of an atomic bus transaction.
 * @note Thread-safe: Plain value type.
 *
 * A transaction is an ordered span of Operations that the bus driver executes
 * without letting another bus participant interleave. Operations only borrow
 * their buffers; the caller keeps them alive for the duration of the call.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace regiface {

namespace bus {

/* ----------------------------- OperationType ----------------------------- */

/**
 * @brief Direction of a transaction step.
 */
enum class OperationType : std::uint8_t {
  WRITE = 0, ///< Controller sends bytes to the device
  READ,      ///< Controller receives bytes from the device
};

/**
 * @brief Human-readable operation type.
 * @note RT-safe: Returns static string pointer.
 */
[[nodiscard]] const char* toString(OperationType type) noexcept;

/* ----------------------------- Operation ----------------------------- */

/**
 * @brief One write or read within a transaction.
 */
struct Operation {
  OperationType type{OperationType::WRITE}; ///< Direction
  std::span<const std::uint8_t> writeData{}; ///< Bytes to send (WRITE only)
  std::span<std::uint8_t> readBuffer{};      ///< Bytes to fill (READ only)

  /// @brief Build a write step.
  [[nodiscard]] static Operation write(std::span<const std::uint8_t> data) noexcept;

  /// @brief Build a read step filling the whole buffer.
  [[nodiscard]] static Operation read(std::span<std::uint8_t> buffer) noexcept;

  [[nodiscard]] bool isWrite() const noexcept;
  [[nodiscard]] bool isRead() const noexcept;

  /// @brief Number of bytes moved by this step.
  [[nodiscard]] std::size_t size() const noexcept;

  /// @brief Human-readable summary (e.g., "write [0x2a]" or "read 2 bytes").
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

} // namespace bus

} // namespace regiface

#endif // REGIFACE_BUS_OPERATION_HPP
