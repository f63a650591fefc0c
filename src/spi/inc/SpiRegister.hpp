#ifndef REGIFACE_SPI_SPI_REGISTER_HPP
#define REGIFACE_SPI_SPI_REGISTER_HPP
/**
 * @file SpiRegister.hpp
 * @brief Register reads, register writes and command invocations over SPI.
 * @note Thread-safe: Stateless. The device handle is borrowed exclusively for
 *       one call.
 * @note RT-safe: No allocation beyond what the device driver does.
 *
 * The device is selected by its chip select, so no address is passed. Each
 * function issues exactly one transaction:
 *  - readRegister:  [Write(id), Read(payload)]
 *  - writeRegister: [Write(id), Write(payload)]
 *  - invokeCommand: [Write(id), Write(params), Read(response)]
 */

#include "src/async/inc/Task.hpp"
#include "src/bus/inc/SpiBus.hpp"
#include "src/core/inc/Command.hpp"
#include "src/core/inc/Register.hpp"
#include "src/transfer/inc/TransferPlan.hpp"

#include <etl/expected.h>

#include <utility>

namespace regiface {

namespace spi {

template <typename D, ReadableRegister R>
using ReadError = typename transfer::ReadPlan<R>::template ErrorFor<typename D::Error>;

template <typename D, WritableRegister R>
using WriteError = typename transfer::WritePlan<R>::template ErrorFor<typename D::Error>;

template <typename D, Command C>
using InvokeError = typename transfer::CommandPlan<C>::template ErrorFor<typename D::Error>;

/* ----------------------------- Blocking ----------------------------- */

namespace blocking {

/**
 * @brief Read register R from the device.
 * @param dev SPI device driver (borrowed for the call).
 * @return Decoded register value, or the failing phase.
 */
template <ReadableRegister R, bus::SpiDevice D>
[[nodiscard]] etl::expected<R, ReadError<D, R>> readRegister(D& dev) {
  transfer::ReadPlan<R> plan;
  auto ops = plan.operations();
  return plan.complete(dev.transaction(ops));
}

/**
 * @brief Write a register value to the device.
 * @param dev SPI device driver (borrowed for the call).
 * @param reg Value to write (consumed).
 * @return Success, or the failing phase. On serialization failure the bus is untouched.
 */
template <WritableRegister R, bus::SpiDevice D>
[[nodiscard]] etl::expected<void, WriteError<D, R>> writeRegister(D& dev, R reg) {
  auto prepared = transfer::WritePlan<R>::template prepare<typename D::Error>(std::move(reg));
  if (!prepared.has_value()) {
    return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  return plan.complete(dev.transaction(ops));
}

/**
 * @brief Invoke a command on the device and decode its response.
 * @param dev SPI device driver (borrowed for the call).
 * @param cmd Command carrying its parameters (consumed).
 * @return Decoded response, or the failing phase.
 */
template <Command C, bus::SpiDevice D>
[[nodiscard]] etl::expected<typename C::ResponseParameters, InvokeError<D, C>>
invokeCommand(D& dev, C cmd) {
  auto prepared = transfer::CommandPlan<C>::template prepare<typename D::Error>(std::move(cmd));
  if (!prepared.has_value()) {
    return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  return plan.complete(dev.transaction(ops));
}

} // namespace blocking

/* ----------------------------- Async ----------------------------- */

namespace async {

template <ReadableRegister R, bus::AsyncSpiDevice D>
Task<etl::expected<R, ReadError<D, R>>> readRegister(D& dev) {
  transfer::ReadPlan<R> plan;
  auto ops = plan.operations();
  co_return plan.complete(co_await dev.transaction(ops));
}

template <WritableRegister R, bus::AsyncSpiDevice D>
Task<etl::expected<void, WriteError<D, R>>> writeRegister(D& dev, R reg) {
  auto prepared = transfer::WritePlan<R>::template prepare<typename D::Error>(std::move(reg));
  if (!prepared.has_value()) {
    co_return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  co_return plan.complete(co_await dev.transaction(ops));
}

template <Command C, bus::AsyncSpiDevice D>
Task<etl::expected<typename C::ResponseParameters, InvokeError<D, C>>> invokeCommand(D& dev,
                                                                                    C cmd) {
  auto prepared = transfer::CommandPlan<C>::template prepare<typename D::Error>(std::move(cmd));
  if (!prepared.has_value()) {
    co_return etl::unexpected(std::move(prepared).error());
  }

  auto& plan = prepared.value();
  auto ops = plan.operations();
  co_return plan.complete(co_await dev.transaction(ops));
}

} // namespace async

} // namespace spi

} // namespace regiface

#endif // REGIFACE_SPI_SPI_REGISTER_HPP
