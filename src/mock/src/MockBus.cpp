/**
 * @file MockBus.cpp
 * @brief Expectation matching and call recording for the bus doubles.
 */

#include "src/mock/inc/MockBus.hpp"
#include "src/core/inc/ByteArray.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace regiface {

namespace mock {

namespace {

/* ----------------------------- Helpers ----------------------------- */

RecordedCall record(CallType call, std::uint16_t address, std::span<bus::Operation> operations) {
  RecordedCall rec{};
  rec.call = call;
  rec.address = address;
  rec.operations.reserve(operations.size());

  for (const bus::Operation& OP : operations) {
    RecordedOperation recOp{};
    recOp.type = OP.type;
    if (OP.isWrite()) {
      recOp.written.assign(OP.writeData.begin(), OP.writeData.end());
    } else {
      recOp.readLength = OP.readBuffer.size();
    }
    rec.operations.push_back(std::move(recOp));
  }

  return rec;
}

/**
 * Compare one operation; empty string on match.
 */
std::string compareOperation(std::size_t index, const ExpectedOperation& expected,
                             const bus::Operation& actual) {
  if (expected.type != actual.type) {
    return fmt::format("operation {}: expected {}, got {}", index, bus::toString(expected.type),
                       bus::toString(actual.type));
  }

  if (actual.isWrite()) {
    if (!std::equal(expected.bytes.begin(), expected.bytes.end(), actual.writeData.begin(),
                    actual.writeData.end())) {
      return fmt::format("operation {}: expected write {}, got write {}", index,
                         toHexString(expected.bytes), toHexString(actual.writeData));
    }
    return {};
  }

  if (expected.bytes.size() != actual.readBuffer.size()) {
    return fmt::format("operation {}: expected read of {} bytes, got read of {} bytes", index,
                       expected.bytes.size(), actual.readBuffer.size());
  }
  return {};
}

} // anonymous namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(MockStatus status) noexcept {
  switch (status) {
  case MockStatus::INJECTED:
    return "INJECTED";
  case MockStatus::UNEXPECTED_CALL:
    return "UNEXPECTED_CALL";
  case MockStatus::MISMATCH:
    return "MISMATCH";
  }
  return "UNKNOWN";
}

const char* toString(CallType call) noexcept {
  switch (call) {
  case CallType::WRITE_READ:
    return "writeRead";
  case CallType::TRANSACTION:
    return "transaction";
  }
  return "unknown";
}

std::string MockError::toString() const {
  if (detail.empty()) {
    return mock::toString(status);
  }
  return fmt::format("{}: {}", mock::toString(status), detail);
}

/* ----------------------------- ExpectedOperation Methods ----------------------------- */

ExpectedOperation ExpectedOperation::write(std::vector<std::uint8_t> bytes) {
  return ExpectedOperation{bus::OperationType::WRITE, std::move(bytes)};
}

ExpectedOperation ExpectedOperation::read(std::vector<std::uint8_t> bytes) {
  return ExpectedOperation{bus::OperationType::READ, std::move(bytes)};
}

std::string ExpectedOperation::toString() const {
  if (type == bus::OperationType::WRITE) {
    return fmt::format("write {}", toHexString(bytes));
  }
  return fmt::format("read {}", toHexString(bytes));
}

/* ----------------------------- Expectation Methods ----------------------------- */

Expectation Expectation::writeRead(std::uint16_t address, std::vector<std::uint8_t> write,
                                   std::vector<std::uint8_t> response) {
  Expectation exp{};
  exp.call = CallType::WRITE_READ;
  exp.address = address;
  exp.operations.push_back(ExpectedOperation::write(std::move(write)));
  exp.operations.push_back(ExpectedOperation::read(std::move(response)));
  return exp;
}

Expectation Expectation::transaction(std::uint16_t address,
                                     std::initializer_list<ExpectedOperation> operations) {
  Expectation exp{};
  exp.call = CallType::TRANSACTION;
  exp.address = address;
  exp.operations.assign(operations.begin(), operations.end());
  return exp;
}

Expectation Expectation::transaction(std::initializer_list<ExpectedOperation> operations) {
  return transaction(0, operations);
}

Expectation Expectation::withError() && {
  fail = true;
  return std::move(*this);
}

std::string Expectation::toString() const {
  std::string out = fmt::format("{} @0x{:02x} [", mock::toString(call), address);
  for (std::size_t i = 0; i < operations.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += operations[i].toString();
  }
  out += "]";
  if (fail) {
    out += " (fails)";
  }
  return out;
}

/* ----------------------------- RecordedCall Methods ----------------------------- */

std::string RecordedOperation::toString() const {
  if (type == bus::OperationType::WRITE) {
    return fmt::format("write {}", toHexString(written));
  }
  return fmt::format("read {} bytes", readLength);
}

std::string RecordedCall::toString() const {
  std::string out = fmt::format("{} @0x{:02x} [", mock::toString(call), address);
  for (std::size_t i = 0; i < operations.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += operations[i].toString();
  }
  out += "]";
  return out;
}

/* ----------------------------- MockBus Methods ----------------------------- */

MockBus::MockBus(std::vector<Expectation> expectations) : expectations_(std::move(expectations)) {}

void MockBus::expect(Expectation expectation) { expectations_.push_back(std::move(expectation)); }

etl::expected<void, MockError> MockBus::handle(CallType call, std::uint16_t address,
                                               std::span<bus::Operation> operations) {
  calls_.push_back(record(call, address, operations));

  if (next_ >= expectations_.size()) {
    mismatched_ = true;
    return etl::unexpected(MockError{MockStatus::UNEXPECTED_CALL, calls_.back().toString()});
  }

  const Expectation& EXP = expectations_[next_++];

  if (EXP.call != call || EXP.address != address) {
    mismatched_ = true;
    return etl::unexpected(MockError{
        MockStatus::MISMATCH,
        fmt::format("expected {}, got {}", EXP.toString(), calls_.back().toString())});
  }

  if (EXP.operations.size() != operations.size()) {
    mismatched_ = true;
    return etl::unexpected(MockError{MockStatus::MISMATCH,
                                     fmt::format("expected {} operations, got {}",
                                                 EXP.operations.size(), operations.size())});
  }

  for (std::size_t i = 0; i < operations.size(); ++i) {
    std::string diff = compareOperation(i, EXP.operations[i], operations[i]);
    if (!diff.empty()) {
      mismatched_ = true;
      return etl::unexpected(MockError{MockStatus::MISMATCH, std::move(diff)});
    }
  }

  if (EXP.fail) {
    return etl::unexpected(MockError{MockStatus::INJECTED, EXP.toString()});
  }

  for (std::size_t i = 0; i < operations.size(); ++i) {
    if (operations[i].isRead()) {
      std::copy(EXP.operations[i].bytes.begin(), EXP.operations[i].bytes.end(),
                operations[i].readBuffer.begin());
    }
  }

  return {};
}

const std::vector<RecordedCall>& MockBus::calls() const noexcept { return calls_; }

std::size_t MockBus::remaining() const noexcept { return expectations_.size() - next_; }

bool MockBus::done() const noexcept { return !mismatched_ && remaining() == 0; }

} // namespace mock

} // namespace regiface
