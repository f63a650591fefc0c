#ifndef REGIFACE_BUS_I2C_BUS_HPP
#define REGIFACE_BUS_I2C_BUS_HPP
/**
 * @file I2cBus.hpp
 * @brief Contract expected from an I2C bus driver.
 *
 * The library does not talk to hardware itself. A driver type D satisfies
 * I2cBus<D, A> (blocking) or AsyncI2cBus<D, A> (async) by providing:
 *
 * @code
 * struct MyBus {
 *   using Error = MyError;
 *   etl::expected<void, Error> writeRead(A addr, std::span<const std::uint8_t> out,
 *                                 std::span<std::uint8_t> in);
 *   etl::expected<void, Error> transaction(A addr, std::span<bus::Operation> ops);
 * };
 * @endcode
 *
 * writeRead() writes `out` then reads `in.size()` bytes with a repeated start
 * and no stop in between. transaction() executes every operation in order as
 * one uninterrupted bus transaction. Async drivers return an awaitable whose
 * result is the same etl::expected<void, Error>.
 */

#include "src/async/inc/Task.hpp"
#include "src/bus/inc/Operation.hpp"

#include <etl/expected.h>

#include <concepts>
#include <cstdint>
#include <span>

namespace regiface {

namespace bus {

/* ----------------------------- Addressing ----------------------------- */

/// 7-bit I2C address (0x00-0x7F).
using SevenBitAddress = std::uint8_t;

/// 10-bit I2C address (0x000-0x3FF).
using TenBitAddress = std::uint16_t;

/// Highest valid 7-bit address.
inline constexpr SevenBitAddress SEVEN_BIT_ADDR_MAX = 0x7F;

/// Highest valid 10-bit address.
inline constexpr TenBitAddress TEN_BIT_ADDR_MAX = 0x3FF;

/// Supported I2C address modes.
template <typename A>
concept AddressMode = std::same_as<A, SevenBitAddress> || std::same_as<A, TenBitAddress>;

/* ----------------------------- Contracts ----------------------------- */

/// Blocking I2C bus driver.
template <typename D, typename A>
concept I2cBus = AddressMode<A> && requires(D& dev, A addr, std::span<const std::uint8_t> out,
                                            std::span<std::uint8_t> in,
                                            std::span<Operation> ops) {
  typename D::Error;
  { dev.writeRead(addr, out, in) } -> std::same_as<etl::expected<void, typename D::Error>>;
  { dev.transaction(addr, ops) } -> std::same_as<etl::expected<void, typename D::Error>>;
};

/// Suspension-capable I2C bus driver.
template <typename D, typename A>
concept AsyncI2cBus = AddressMode<A> && requires(D& dev, A addr, std::span<const std::uint8_t> out,
                                                 std::span<std::uint8_t> in,
                                                 std::span<Operation> ops) {
  typename D::Error;
  { dev.writeRead(addr, out, in) } -> AwaitableOf<etl::expected<void, typename D::Error>>;
  { dev.transaction(addr, ops) } -> AwaitableOf<etl::expected<void, typename D::Error>>;
};

} // namespace bus

} // namespace regiface

#endif // REGIFACE_BUS_I2C_BUS_HPP
