#ifndef REGIFACE_MOCK_SPI_MOCK_HPP
#define REGIFACE_MOCK_SPI_MOCK_HPP
/**
 * @file SpiMock.hpp
 * @brief SPI device doubles (blocking and async) backed by MockBus.
 * @note Not thread-safe: One caller at a time.
 * @note NOT RT-safe: Allocates for call records.
 *
 * SPI calls are recorded with address 0. Queue expectations with
 * Expectation::transaction({...}).
 */

#include "src/async/inc/Task.hpp"
#include "src/bus/inc/Operation.hpp"
#include "src/bus/inc/SpiBus.hpp"
#include "src/mock/inc/AsyncMockBus.hpp"
#include "src/mock/inc/MockBus.hpp"

#include <etl/expected.h>

#include <span>

namespace regiface {

namespace mock {

/* ----------------------------- SpiMock ----------------------------- */

/**
 * @brief Blocking SPI device double.
 */
class SpiMock : public MockBus {
public:
  using Error = MockError;
  using MockBus::MockBus;

  [[nodiscard]] etl::expected<void, Error> transaction(std::span<bus::Operation> ops) {
    return handle(CallType::TRANSACTION, 0, ops);
  }
};

/* ----------------------------- AsyncSpiMock ----------------------------- */

/**
 * @brief Async SPI device double.
 *
 * Completes inline by default; see AsyncMockBus::completeOnWorkerThread().
 */
class AsyncSpiMock : public AsyncMockBus {
public:
  using Error = MockError;
  using AsyncMockBus::AsyncMockBus;

  Task<etl::expected<void, Error>> transaction(std::span<bus::Operation> ops) {
    co_await completion();
    co_return handle(CallType::TRANSACTION, 0, ops);
  }
};

} // namespace mock

} // namespace regiface

#endif // REGIFACE_MOCK_SPI_MOCK_HPP
