/**
 * @file MockBus_uTest.cpp
 * @brief Unit tests for the regiface::mock expectation engine and bus doubles.
 */

#include "src/async/inc/SyncWait.hpp"
#include "src/async/inc/Task.hpp"
#include "src/bus/inc/I2cBus.hpp"
#include "src/bus/inc/SpiBus.hpp"
#include "src/mock/inc/I2cMock.hpp"
#include "src/mock/inc/MockBus.hpp"
#include "src/mock/inc/SpiMock.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using regiface::syncWait;
using regiface::Task;
using regiface::bus::AsyncI2cBus;
using regiface::bus::AsyncSpiDevice;
using regiface::bus::I2cBus;
using regiface::bus::Operation;
using regiface::bus::SevenBitAddress;
using regiface::bus::SpiDevice;
using regiface::bus::TenBitAddress;
using regiface::mock::AsyncI2cMock;
using regiface::mock::AsyncSpiMock;
using regiface::mock::CallType;
using regiface::mock::ExpectedOperation;
using regiface::mock::Expectation;
using regiface::mock::I2cMock;
using regiface::mock::MockError;
using regiface::mock::MockStatus;
using regiface::mock::SpiMock;

static_assert(I2cBus<I2cMock, SevenBitAddress>);
static_assert(I2cBus<I2cMock, TenBitAddress>);
static_assert(AsyncI2cBus<AsyncI2cMock, SevenBitAddress>);
static_assert(SpiDevice<SpiMock>);
static_assert(AsyncSpiDevice<AsyncSpiMock>);

namespace {

/// Two back-to-back reads from one coroutine; the second starts on the worker.
Task<std::thread::id> readTwice(AsyncI2cMock& bus, std::array<std::uint8_t, 1>& buf) {
  std::array<Operation, 1> ops{Operation::read(buf)};
  if (!(co_await bus.transaction(SevenBitAddress{0x20}, ops)).has_value()) {
    co_return std::thread::id{};
  }
  if (!(co_await bus.transaction(SevenBitAddress{0x20}, ops)).has_value()) {
    co_return std::thread::id{};
  }
  co_return std::this_thread::get_id();
}

} // namespace

/* ----------------------------- Matching ----------------------------- */

class I2cMockTest : public ::testing::Test {
protected:
  I2cMock bus_{};
  std::array<std::uint8_t, 1> id_{0x10};
  std::array<std::uint8_t, 2> buf_{};
};

/** @test A matching call fills the read buffer and consumes the expectation. */
TEST_F(I2cMockTest, MatchFillsReads) {
  bus_.expect(Expectation::writeRead(0x50, {0x10}, {0xCA, 0xFE}));

  EXPECT_TRUE(bus_.writeRead(SevenBitAddress{0x50}, id_, buf_).has_value());
  EXPECT_EQ(buf_[0], 0xCAU);
  EXPECT_EQ(buf_[1], 0xFEU);
  EXPECT_EQ(bus_.remaining(), 0U);
  EXPECT_TRUE(bus_.done());
}

/** @test A call with no expectation left is UNEXPECTED_CALL. */
TEST_F(I2cMockTest, UnexpectedCall) {
  auto res = bus_.writeRead(SevenBitAddress{0x50}, id_, buf_);

  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().status, MockStatus::UNEXPECTED_CALL);
  EXPECT_EQ(bus_.calls().size(), 1U);
  EXPECT_FALSE(bus_.done());
}

/** @test Wrong address is a MISMATCH. */
TEST_F(I2cMockTest, AddressMismatch) {
  bus_.expect(Expectation::writeRead(0x51, {0x10}, {0x00, 0x00}));

  auto res = bus_.writeRead(SevenBitAddress{0x50}, id_, buf_);

  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().status, MockStatus::MISMATCH);
  EXPECT_FALSE(bus_.done());
}

/** @test Wrong written bytes are a MISMATCH with both sides in the detail. */
TEST_F(I2cMockTest, WriteBytesMismatch) {
  bus_.expect(Expectation::writeRead(0x50, {0x11}, {0x00, 0x00}));

  auto res = bus_.writeRead(SevenBitAddress{0x50}, id_, buf_);

  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().status, MockStatus::MISMATCH);
  EXPECT_NE(res.error().detail.find("0x11"), std::string::npos);
  EXPECT_NE(res.error().detail.find("0x10"), std::string::npos);
}

/** @test Wrong read length is a MISMATCH and leaves the buffer untouched. */
TEST_F(I2cMockTest, ReadLengthMismatch) {
  bus_.expect(Expectation::writeRead(0x50, {0x10}, {0xAA}));

  auto res = bus_.writeRead(SevenBitAddress{0x50}, id_, buf_);

  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().status, MockStatus::MISMATCH);
  EXPECT_EQ(buf_[0], 0U);
}

/** @test writeRead and transaction are distinct call kinds. */
TEST_F(I2cMockTest, CallKindMismatch) {
  bus_.expect(Expectation::writeRead(0x50, {0x10}, {0x00, 0x00}));

  std::array<Operation, 2> ops{Operation::write(id_), Operation::read(buf_)};
  auto res = bus_.transaction(SevenBitAddress{0x50}, ops);

  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().status, MockStatus::MISMATCH);
  EXPECT_EQ(bus_.calls()[0].call, CallType::TRANSACTION);
}

/** @test Injected failures match first, then fail without filling reads. */
TEST_F(I2cMockTest, InjectedFailure) {
  bus_.expect(Expectation::writeRead(0x50, {0x10}, {0x12, 0x34}).withError());

  auto res = bus_.writeRead(SevenBitAddress{0x50}, id_, buf_);

  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().status, MockStatus::INJECTED);
  EXPECT_EQ(buf_[0], 0U);
  // The expectation was consumed as planned
  EXPECT_TRUE(bus_.done());
}

/** @test Calls are recorded in order with their operations. */
TEST_F(I2cMockTest, RecordsCalls) {
  bus_.expect(Expectation::transaction(0x50, {ExpectedOperation::write({0x10}),
                                              ExpectedOperation::write({0x01, 0x02})}));

  const std::array<std::uint8_t, 2> PAYLOAD{0x01, 0x02};
  std::array<Operation, 2> ops{Operation::write(id_), Operation::write(PAYLOAD)};
  ASSERT_TRUE(bus_.transaction(SevenBitAddress{0x50}, ops).has_value());

  ASSERT_EQ(bus_.calls().size(), 1U);
  const auto& CALL = bus_.calls()[0];
  EXPECT_EQ(CALL.address, 0x50U);
  ASSERT_EQ(CALL.operations.size(), 2U);
  EXPECT_EQ(CALL.operations[1].written, (std::vector<std::uint8_t>{0x01, 0x02}));
  EXPECT_EQ(CALL.toString(), "transaction @0x50 [write [0x10], write [0x01, 0x02]]");
}

/* ----------------------------- Strings ----------------------------- */

/** @test Error strings carry the status and detail. */
TEST(MockErrorTest, ToString) {
  const MockError PLAIN{MockStatus::INJECTED, ""};
  EXPECT_EQ(PLAIN.toString(), "INJECTED");

  const MockError DETAILED{MockStatus::MISMATCH, "operation 0"};
  EXPECT_EQ(DETAILED.toString(), "MISMATCH: operation 0");
}

/** @test Expectations describe themselves for test output. */
TEST(ExpectationTest, ToString) {
  const Expectation EXP = Expectation::writeRead(0x48, {0x2A}, {0x01}).withError();
  EXPECT_EQ(EXP.toString(), "writeRead @0x48 [write [0x2a], read [0x01]] (fails)");
}

/* ----------------------------- Async Doubles ----------------------------- */

/** @test AsyncI2cMock matches the same way when completing inline. */
TEST(AsyncI2cMockTest, Inline) {
  AsyncI2cMock bus;
  bus.expect(Expectation::writeRead(0x20, {0x01}, {0x7F}));

  const std::array<std::uint8_t, 1> ID{0x01};
  std::array<std::uint8_t, 1> buf{};
  auto res = syncWait(bus.writeRead(SevenBitAddress{0x20}, ID, buf));

  EXPECT_TRUE(res.has_value());
  EXPECT_EQ(buf[0], 0x7FU);
  EXPECT_TRUE(bus.done());
}

/** @test AsyncI2cMock can complete from a worker thread. */
TEST(AsyncI2cMockTest, WorkerThread) {
  AsyncI2cMock bus;
  bus.completeOnWorkerThread(true);
  bus.expect(Expectation::transaction(0x20, {ExpectedOperation::read({0x01, 0x02})}));

  std::array<std::uint8_t, 2> buf{};
  std::array<Operation, 1> ops{Operation::read(buf)};
  auto res = syncWait(bus.transaction(SevenBitAddress{0x20}, ops));

  EXPECT_TRUE(res.has_value());
  EXPECT_EQ(buf[1], 0x02U);
  EXPECT_TRUE(bus.done());
}

/** @test Repeated worker completions reuse one thread. */
TEST(AsyncI2cMockTest, WorkerThreadIsReused) {
  AsyncI2cMock bus;
  bus.completeOnWorkerThread(true);
  EXPECT_EQ(bus.workerThreadsStarted(), 0U);

  std::array<std::uint8_t, 1> buf{};
  std::array<Operation, 1> ops{Operation::read(buf)};
  for (std::uint8_t i = 0; i < 5; ++i) {
    bus.expect(Expectation::transaction(0x20, {ExpectedOperation::read({i})}));
    EXPECT_TRUE(syncWait(bus.transaction(SevenBitAddress{0x20}, ops)).has_value());
    EXPECT_EQ(buf[0], i);
  }

  EXPECT_EQ(bus.workerThreadsStarted(), 1U);
  EXPECT_TRUE(bus.done());
}

/** @test A call issued while running on the worker is queued, not deadlocked. */
TEST(AsyncI2cMockTest, ChainedCallsOnWorker) {
  AsyncI2cMock bus;
  bus.completeOnWorkerThread(true);
  bus.expect(Expectation::transaction(0x20, {ExpectedOperation::read({0x11})}));
  bus.expect(Expectation::transaction(0x20, {ExpectedOperation::read({0x22})}));

  std::array<std::uint8_t, 1> buf{};
  const std::thread::id RESUMED_ON = syncWait(readTwice(bus, buf));

  EXPECT_NE(RESUMED_ON, std::thread::id{});
  EXPECT_NE(RESUMED_ON, std::this_thread::get_id());
  EXPECT_EQ(buf[0], 0x22U);
  EXPECT_EQ(bus.workerThreadsStarted(), 1U);
  EXPECT_TRUE(bus.done());
}

/** @test AsyncSpiMock supports worker-thread completion too. */
TEST(AsyncSpiMockTest, WorkerThread) {
  AsyncSpiMock dev({Expectation::transaction({ExpectedOperation::read({0xAB})})});
  dev.completeOnWorkerThread(true);

  std::array<std::uint8_t, 1> buf{};
  std::array<Operation, 1> ops{Operation::read(buf)};
  EXPECT_TRUE(syncWait(dev.transaction(ops)).has_value());

  EXPECT_EQ(buf[0], 0xABU);
  EXPECT_EQ(dev.workerThreadsStarted(), 1U);
  EXPECT_TRUE(dev.done());
}

/** @test SPI doubles record address 0. */
TEST(SpiMockTest, AddressIsZero) {
  SpiMock dev({Expectation::transaction({ExpectedOperation::write({0x9F})})});
  AsyncSpiMock asyncDev({Expectation::transaction({ExpectedOperation::write({0x9F})})});

  const std::array<std::uint8_t, 1> CMD{0x9F};
  std::array<Operation, 1> ops{Operation::write(CMD)};

  EXPECT_TRUE(dev.transaction(ops).has_value());
  EXPECT_TRUE(syncWait(asyncDev.transaction(ops)).has_value());
  EXPECT_EQ(dev.calls()[0].address, 0U);
  EXPECT_TRUE(dev.done());
  EXPECT_TRUE(asyncDev.done());
}
