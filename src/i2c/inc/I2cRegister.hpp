#ifndef REGIFACE_I2C_I2C_REGISTER_HPP
#define REGIFACE_I2C_I2C_REGISTER_HPP
/**
 * @file I2cRegister.hpp
 * @brief Register reads, register writes and command invocations over I2C.
 * @note Thread-safe: Stateless. The bus handle is borrowed exclusively for one
 *       call; callers sharing a bus must serialize access themselves.
 * @note RT-safe: No allocation beyond what the bus driver does.
 *
 * Each function issues exactly one bus call:
 *  - readRegister:  writeRead(addr, id, payload)
 *  - writeRegister: transaction(addr, [Write(id), Write(payload)])
 *  - invokeCommand: transaction(addr, [Write(id), Write(params), Read(response)])
 *
 * Payload serialization happens before the bus call, deserialization after it
 * succeeds. Errors are returned as-is; nothing is retried.
 *
 * The address mode defaults to 7-bit; pass it explicitly for 10-bit devices:
 * `readRegister<Reg, bus::TenBitAddress>(dev, 0x150)`.
 *
 * `blocking::` functions take an I2cBus driver; `async::` functions take an
 * AsyncI2cBus driver and return a Task that must be co_awaited (or syncWait'ed).
 */

#include "src/async/inc/Task.hpp"
#include "src/bus/inc/I2cBus.hpp"
#include "src/core/inc/Command.hpp"
#include "src/core/inc/Register.hpp"
#include "src/transfer/inc/TransferPlan.hpp"

#include <etl/expected.h>

#include <type_traits>
#include <utility>

namespace regiface {

namespace i2c {

/// Error returned by readRegister<R> on driver D.
template <typename D, ReadableRegister R>
using ReadError = typename transfer::ReadPlan<R>::template ErrorFor<typename D::Error>;

/// Error returned by writeRegister(R) on driver D.
template <typename D, WritableRegister R>
using WriteError = typename transfer::WritePlan<R>::template ErrorFor<typename D::Error>;

/// Error returned by invokeCommand(C) on driver D.
template <typename D, Command C>
using InvokeError = typename transfer::CommandPlan<C>::template ErrorFor<typename D::Error>;

/* ----------------------------- Blocking ----------------------------- */

namespace blocking {

/**
 * @brief Read register R from the device at addr.
 * @param dev Bus driver (borrowed for the call).
 * @param addr Device address.
 * @return Decoded register value, or the failing phase.
 */
template <ReadableRegister R, bus::AddressMode A = bus::SevenBitAddress, typename D>
  requires bus::I2cBus<D, A>
[[nodiscard]] etl::expected<R, ReadError<D, R>> readRegister(D& dev, std::type_identity_t<A> addr) {
  transfer::ReadPlan<R> plan;
  return plan.complete(dev.writeRead(addr, plan.idBytes(), plan.responseBuffer()));
}

/**
 * @brief Write a register value to the device at addr.
 * @param dev Bus driver (borrowed for the call).
 * @param addr Device address.
 * @param reg Value to write (consumed).
 * @return Success, or the failing phase. On serialization failure the bus is untouched.
 */
template <WritableRegister R, bus::AddressMode A = bus::SevenBitAddress, typename D>
  requires bus::I2cBus<D, A>
[[nodiscard]] etl::expected<void, WriteError<D, R>>
writeRegister(D& dev, std::type_identity_t<A> addr, R reg) {
  auto prepared = transfer::WritePlan<R>::template prepare<typename D::Error>(std::move(reg));
  if (!prepared.has_value()) {
    return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  return plan.complete(dev.transaction(addr, ops));
}

/**
 * @brief Invoke a command on the device at addr and decode its response.
 * @param dev Bus driver (borrowed for the call).
 * @param addr Device address.
 * @param cmd Command carrying its parameters (consumed).
 * @return Decoded response, or the failing phase.
 */
template <Command C, bus::AddressMode A = bus::SevenBitAddress, typename D>
  requires bus::I2cBus<D, A>
[[nodiscard]] etl::expected<typename C::ResponseParameters, InvokeError<D, C>>
invokeCommand(D& dev, std::type_identity_t<A> addr, C cmd) {
  auto prepared = transfer::CommandPlan<C>::template prepare<typename D::Error>(std::move(cmd));
  if (!prepared.has_value()) {
    return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  return plan.complete(dev.transaction(addr, ops));
}

} // namespace blocking

/* ----------------------------- Async ----------------------------- */

namespace async {

/// @brief Async readRegister; suspends only while the driver's writeRead suspends.
template <ReadableRegister R, bus::AddressMode A = bus::SevenBitAddress, typename D>
  requires bus::AsyncI2cBus<D, A>
Task<etl::expected<R, ReadError<D, R>>> readRegister(D& dev, std::type_identity_t<A> addr) {
  transfer::ReadPlan<R> plan;
  co_return plan.complete(co_await dev.writeRead(addr, plan.idBytes(), plan.responseBuffer()));
}

/// @brief Async writeRegister; the payload is serialized before the first suspension.
template <WritableRegister R, bus::AddressMode A = bus::SevenBitAddress, typename D>
  requires bus::AsyncI2cBus<D, A>
Task<etl::expected<void, WriteError<D, R>>> writeRegister(D& dev, std::type_identity_t<A> addr,
                                                          R reg) {
  auto prepared = transfer::WritePlan<R>::template prepare<typename D::Error>(std::move(reg));
  if (!prepared.has_value()) {
    co_return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  co_return plan.complete(co_await dev.transaction(addr, ops));
}

/// @brief Async invokeCommand.
template <Command C, bus::AddressMode A = bus::SevenBitAddress, typename D>
  requires bus::AsyncI2cBus<D, A>
Task<etl::expected<typename C::ResponseParameters, InvokeError<D, C>>>
invokeCommand(D& dev, std::type_identity_t<A> addr, C cmd) {
  auto prepared = transfer::CommandPlan<C>::template prepare<typename D::Error>(std::move(cmd));
  if (!prepared.has_value()) {
    co_return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  co_return plan.complete(co_await dev.transaction(addr, ops));
}

} // namespace async

} // namespace i2c

} // namespace regiface

#endif // REGIFACE_I2C_I2C_REGISTER_HPP
