#ifndef REGIFACE_MOCK_I2C_MOCK_HPP
#define REGIFACE_MOCK_I2C_MOCK_HPP
/**
 * @file I2cMock.hpp
 * @brief I2C bus doubles (blocking and async) backed by MockBus.
 * @note Not thread-safe: One caller at a time.
 * @note NOT RT-safe: Allocates for call records.
 *
 * @code
 * mock::I2cMock bus({mock::Expectation::writeRead(0x48, {0x2A}, {0x01, 0x02})});
 * auto value = i2c::blocking::readRegister<Temperature>(bus, 0x48);
 * EXPECT_TRUE(bus.done());
 * @endcode
 */

#include "src/async/inc/Task.hpp"
#include "src/bus/inc/I2cBus.hpp"
#include "src/bus/inc/Operation.hpp"
#include "src/mock/inc/AsyncMockBus.hpp"
#include "src/mock/inc/MockBus.hpp"

#include <etl/expected.h>

#include <array>
#include <cstdint>
#include <span>

namespace regiface {

namespace mock {

/* ----------------------------- I2cMock ----------------------------- */

/**
 * @brief Blocking I2C driver double.
 */
class I2cMock : public MockBus {
public:
  using Error = MockError;
  using MockBus::MockBus;

  template <bus::AddressMode A>
  [[nodiscard]] etl::expected<void, Error> writeRead(A addr, std::span<const std::uint8_t> out,
                                                     std::span<std::uint8_t> in) {
    std::array<bus::Operation, 2> ops{bus::Operation::write(out), bus::Operation::read(in)};
    return handle(CallType::WRITE_READ, addr, ops);
  }

  template <bus::AddressMode A>
  [[nodiscard]] etl::expected<void, Error> transaction(A addr, std::span<bus::Operation> ops) {
    return handle(CallType::TRANSACTION, addr, ops);
  }
};

/* ----------------------------- AsyncI2cMock ----------------------------- */

/**
 * @brief Async I2C driver double.
 *
 * Completes inline by default; see AsyncMockBus::completeOnWorkerThread().
 */
class AsyncI2cMock : public AsyncMockBus {
public:
  using Error = MockError;
  using AsyncMockBus::AsyncMockBus;

  template <bus::AddressMode A>
  Task<etl::expected<void, Error>> writeRead(A addr, std::span<const std::uint8_t> out,
                                             std::span<std::uint8_t> in) {
    co_await completion();
    std::array<bus::Operation, 2> ops{bus::Operation::write(out), bus::Operation::read(in)};
    co_return handle(CallType::WRITE_READ, addr, ops);
  }

  template <bus::AddressMode A>
  Task<etl::expected<void, Error>> transaction(A addr, std::span<bus::Operation> ops) {
    co_await completion();
    co_return handle(CallType::TRANSACTION, addr, ops);
  }
};

} // namespace mock

} // namespace regiface

#endif // REGIFACE_MOCK_I2C_MOCK_HPP
