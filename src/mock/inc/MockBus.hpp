#ifndef REGIFACE_MOCK_MOCK_BUS_HPP
#define REGIFACE_MOCK_MOCK_BUS_HPP
/**
 * @file MockBus.hpp
 * @brief Expectation engine shared by the I2C and SPI bus doubles.
 * @note Not thread-safe: One caller at a time (as with a real bus handle).
 * @note NOT RT-safe: Allocates for expectations and call records.
 *
 * A test queues the calls it expects, in order. Each incoming bus call is
 * recorded, then matched against the next expectation: call kind, address and
 * every operation (direction, written bytes, read length) must agree. Read
 * buffers are filled from the expectation. A mismatch, an unexpected call or
 * an injected failure is reported through MockError.
 */

#include "src/bus/inc/Operation.hpp"

#include <etl/expected.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

namespace regiface {

namespace mock {

/* ----------------------------- MockStatus ----------------------------- */

/**
 * @brief Reason a mocked bus call failed.
 */
enum class MockStatus : std::uint8_t {
  INJECTED = 0,    ///< Expectation asked for a bus failure
  UNEXPECTED_CALL, ///< No expectation left
  MISMATCH,        ///< Call did not match the next expectation
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(MockStatus status) noexcept;

/**
 * @brief Error type reported by the mock drivers.
 */
struct MockError {
  MockStatus status{MockStatus::INJECTED}; ///< Failure reason
  std::string detail{};                    ///< What differed, for test output

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- CallType ----------------------------- */

/**
 * @brief Bus entry point that was invoked.
 */
enum class CallType : std::uint8_t {
  WRITE_READ = 0, ///< Combined write-then-read
  TRANSACTION,    ///< Multi-operation transaction
};

/// @brief Human-readable call type.
[[nodiscard]] const char* toString(CallType call) noexcept;

/* ----------------------------- ExpectedOperation ----------------------------- */

/**
 * @brief One operation of an expected call.
 *
 * For WRITE, `bytes` are the bytes the caller must send. For READ, `bytes`
 * are handed back to the caller; the caller's buffer must be the same length.
 */
struct ExpectedOperation {
  bus::OperationType type{bus::OperationType::WRITE};
  std::vector<std::uint8_t> bytes{};

  [[nodiscard]] static ExpectedOperation write(std::vector<std::uint8_t> bytes);
  [[nodiscard]] static ExpectedOperation read(std::vector<std::uint8_t> bytes);

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Expectation ----------------------------- */

/**
 * @brief One expected bus call.
 */
struct Expectation {
  CallType call{CallType::TRANSACTION};
  std::uint16_t address{0}; ///< Device address (0 for SPI)
  std::vector<ExpectedOperation> operations{};
  bool fail{false}; ///< Match, then report MockStatus::INJECTED without filling reads

  /// @brief Expect writeRead(address, write, <response.size() bytes>) returning response.
  [[nodiscard]] static Expectation writeRead(std::uint16_t address, std::vector<std::uint8_t> write,
                                             std::vector<std::uint8_t> response);

  /// @brief Expect transaction(address, operations).
  [[nodiscard]] static Expectation transaction(std::uint16_t address,
                                               std::initializer_list<ExpectedOperation> operations);

  /// @brief Expect an SPI transaction (no address).
  [[nodiscard]] static Expectation transaction(std::initializer_list<ExpectedOperation> operations);

  /// @brief Make the matched call fail with MockStatus::INJECTED.
  [[nodiscard]] Expectation withError() &&;

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- RecordedCall ----------------------------- */

/**
 * @brief Operation as observed by the mock.
 */
struct RecordedOperation {
  bus::OperationType type{bus::OperationType::WRITE};
  std::vector<std::uint8_t> written{}; ///< Bytes sent (WRITE)
  std::size_t readLength{0};           ///< Buffer length offered (READ)

  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Bus call as observed by the mock, before matching.
 */
struct RecordedCall {
  CallType call{CallType::TRANSACTION};
  std::uint16_t address{0};
  std::vector<RecordedOperation> operations{};

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- MockBus ----------------------------- */

/**
 * @brief Ordered expectation queue plus call log.
 */
class MockBus {
public:
  MockBus() = default;
  explicit MockBus(std::vector<Expectation> expectations);

  /// @brief Append an expectation.
  void expect(Expectation expectation);

  /// @brief Record a call and match it against the next expectation.
  [[nodiscard]] etl::expected<void, MockError> handle(CallType call, std::uint16_t address,
                                                      std::span<bus::Operation> operations);

  /// @brief Every call seen so far, matched or not.
  [[nodiscard]] const std::vector<RecordedCall>& calls() const noexcept;

  /// @brief Number of expectations not yet consumed.
  [[nodiscard]] std::size_t remaining() const noexcept;

  /// @brief True when every expectation was consumed and no call failed to match.
  [[nodiscard]] bool done() const noexcept;

private:
  std::vector<Expectation> expectations_{};
  std::size_t next_{0};
  std::vector<RecordedCall> calls_{};
  bool mismatched_{false};
};

} // namespace mock

} // namespace regiface

#endif // REGIFACE_MOCK_MOCK_BUS_HPP
