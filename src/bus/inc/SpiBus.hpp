#ifndef REGIFACE_BUS_SPI_BUS_HPP
#define REGIFACE_BUS_SPI_BUS_HPP
/**
 * @file SpiBus.hpp
 * @brief Contract expected from an SPI device driver.
 *
 * An SPI device is one chip-select on a bus. The driver asserts chip select for
 * the whole transaction, so no device address is passed:
 *
 * @code
 * struct MySpi {
 *   using Error = MyError;
 *   etl::expected<void, Error> transaction(std::span<bus::Operation> ops);
 * };
 * @endcode
 */

#include "src/async/inc/Task.hpp"
#include "src/bus/inc/Operation.hpp"

#include <etl/expected.h>

#include <concepts>
#include <span>

namespace regiface {

namespace bus {

/* ----------------------------- Contracts ----------------------------- */

/// Blocking SPI device driver.
template <typename D>
concept SpiDevice = requires(D& dev, std::span<Operation> ops) {
  typename D::Error;
  { dev.transaction(ops) } -> std::same_as<etl::expected<void, typename D::Error>>;
};

/// Suspension-capable SPI device driver.
template <typename D>
concept AsyncSpiDevice = requires(D& dev, std::span<Operation> ops) {
  typename D::Error;
  { dev.transaction(ops) } -> AwaitableOf<etl::expected<void, typename D::Error>>;
};

} // namespace bus

} // namespace regiface

#endif // REGIFACE_BUS_SPI_BUS_HPP
