/**
 * @file TransferPlan_uTest.cpp
 * @brief Unit tests for regiface::transfer read, write and command plans.
 *
 * Notes:
 *  - Bus outcomes are supplied directly; no driver is involved.
 */

#include "src/transfer/inc/TransferPlan.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using regiface::ByteArray;
using regiface::ErrorKind;
using regiface::Infallible;
using regiface::NoParameters;
using regiface::bus::OperationType;
using regiface::transfer::CommandPlan;
using regiface::transfer::ReadPlan;
using regiface::transfer::WritePlan;

namespace {

/// 16-bit register; reads use opcode 0x8A, writes use 0x0A.
struct Limit {
  using IdType = std::uint8_t;
  static constexpr IdType id() noexcept { return 0x0A; }
  static constexpr IdType readableId() noexcept { return 0x8A; }
  std::uint16_t value{0};
};

enum class LimitError { RESERVED };

/// Command with a one-byte argument and two-byte response.
struct Echo {
  using IdType = std::uint16_t;
  using CommandParameters = std::uint8_t;
  using ResponseParameters = std::uint16_t;

  static constexpr IdType id() noexcept { return 0xBEEF; }
  CommandParameters invokingParameters() && { return arg; }

  std::uint8_t arg{0};
};

using BusResult = etl::expected<void, std::string>;

} // namespace

template <> struct regiface::FromByteArray<Limit> {
  using Array = ByteArray<2>;
  using Error = LimitError;
  static etl::expected<Limit, LimitError> fromBytes(const Array& bytes) noexcept {
    if (bytes[0] == 0xFF) {
      return etl::unexpected(LimitError::RESERVED);
    }
    return Limit{static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1])};
  }
};

template <> struct regiface::ToByteArray<Limit> {
  using Array = ByteArray<2>;
  using Error = LimitError;
  static etl::expected<Array, LimitError> toBytes(Limit l) noexcept {
    if (l.value >= 0xFF00) {
      return etl::unexpected(LimitError::RESERVED);
    }
    return Array{static_cast<std::uint8_t>(l.value >> 8),
                 static_cast<std::uint8_t>(l.value & 0xFF)};
  }
};

/* ----------------------------- ReadPlan ----------------------------- */

/** @test Read plan writes the readable id and reads exactly the payload length. */
TEST(ReadPlanTest, Layout) {
  ReadPlan<Limit> plan;

  ASSERT_EQ(plan.idBytes().size(), 1U);
  EXPECT_EQ(plan.idBytes()[0], 0x8AU);
  EXPECT_EQ(plan.responseBuffer().size(), 2U);

  const auto OPS = plan.operations();
  EXPECT_EQ(OPS[0].type, OperationType::WRITE);
  EXPECT_EQ(OPS[1].type, OperationType::READ);
  EXPECT_EQ(OPS[1].readBuffer.data(), plan.responseBuffer().data());
}

/** @test Completed read decodes the response buffer. */
TEST(ReadPlanTest, DecodesAfterBusSuccess) {
  ReadPlan<Limit> plan;
  plan.responseBuffer()[0] = 0x01;
  plan.responseBuffer()[1] = 0x02;

  auto res = plan.complete(BusResult());
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res.value().value, 0x0102U);
}

/** @test Bus failure is reported without decoding. */
TEST(ReadPlanTest, BusFailureSkipsDecode) {
  ReadPlan<Limit> plan;
  plan.responseBuffer()[0] = 0xFF; // would fail decoding

  auto res = plan.complete(BusResult(etl::unexpected(std::string("nack"))));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind(), ErrorKind::BUS);
  EXPECT_EQ(*res.error().busError(), "nack");
}

/** @test Decoder failure is reported as a deserialization error. */
TEST(ReadPlanTest, DecodeFailure) {
  ReadPlan<Limit> plan;
  plan.responseBuffer()[0] = 0xFF;

  auto res = plan.complete(BusResult());
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind(), ErrorKind::DESERIALIZATION);
  EXPECT_EQ(*res.error().deserializationError(), LimitError::RESERVED);
}

/* ----------------------------- WritePlan ----------------------------- */

/** @test Write plan carries the writeable id and the encoded payload. */
TEST(WritePlanTest, Layout) {
  auto prepared = WritePlan<Limit>::prepare<std::string>(Limit{0x1234});
  ASSERT_TRUE(prepared.has_value());

  const auto& PLAN = prepared.value();
  EXPECT_EQ(PLAN.idBytes()[0], 0x0AU);
  ASSERT_EQ(PLAN.payload().size(), 2U);
  EXPECT_EQ(PLAN.payload()[0], 0x12U);
  EXPECT_EQ(PLAN.payload()[1], 0x34U);

  const auto OPS = PLAN.operations();
  EXPECT_TRUE(OPS[0].isWrite());
  EXPECT_TRUE(OPS[1].isWrite());
}

/** @test Encoder failure stops at prepare(). */
TEST(WritePlanTest, SerializationFailure) {
  auto prepared = WritePlan<Limit>::prepare<std::string>(Limit{0xFF00});
  ASSERT_FALSE(prepared.has_value());
  EXPECT_EQ(prepared.error().kind(), ErrorKind::SERIALIZATION);
  EXPECT_EQ(*prepared.error().serializationError(), LimitError::RESERVED);
}

/** @test Bus failure is mapped on completion. */
TEST(WritePlanTest, BusFailure) {
  auto prepared = WritePlan<Limit>::prepare<std::string>(Limit{1});
  ASSERT_TRUE(prepared.has_value());

  auto res = prepared.value().complete(BusResult(etl::unexpected(std::string("timeout"))));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind(), ErrorKind::BUS);
}

/* ----------------------------- CommandPlan ----------------------------- */

/** @test Command plan: id, parameters, response buffer. */
TEST(CommandPlanTest, Layout) {
  auto prepared = CommandPlan<Echo>::prepare<std::string>(Echo{0x5A});
  ASSERT_TRUE(prepared.has_value());

  auto& plan = prepared.value();
  ASSERT_EQ(plan.idBytes().size(), 2U);
  EXPECT_EQ(plan.idBytes()[0], 0xBEU);
  EXPECT_EQ(plan.idBytes()[1], 0xEFU);
  ASSERT_EQ(plan.parameters().size(), 1U);
  EXPECT_EQ(plan.parameters()[0], 0x5AU);
  EXPECT_EQ(plan.responseBuffer().size(), 2U);

  const auto OPS = plan.operations();
  EXPECT_TRUE(OPS[0].isWrite());
  EXPECT_TRUE(OPS[1].isWrite());
  EXPECT_TRUE(OPS[2].isRead());
}

/** @test Command response is decoded after bus success. */
TEST(CommandPlanTest, DecodesResponse) {
  auto prepared = CommandPlan<Echo>::prepare<std::string>(Echo{1});
  ASSERT_TRUE(prepared.has_value());

  auto& plan = prepared.value();
  plan.responseBuffer()[0] = 0xAB;
  plan.responseBuffer()[1] = 0xCD;

  auto res = plan.complete(BusResult());
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res.value(), 0xABCDU);
}

/** @test NoParameters commands write an empty parameter step. */
TEST(CommandPlanTest, NoParametersIsEmptyWrite) {
  struct Ping {
    using IdType = std::uint8_t;
    using CommandParameters = NoParameters;
    using ResponseParameters = NoParameters;
    static constexpr IdType id() noexcept { return 0x01; }
    CommandParameters invokingParameters() && { return {}; }
  };

  auto prepared = CommandPlan<Ping>::prepare<std::string>(Ping{});
  ASSERT_TRUE(prepared.has_value());

  auto& plan = prepared.value();
  EXPECT_EQ(plan.parameters().size(), 0U);
  EXPECT_EQ(plan.responseBuffer().size(), 0U);
  EXPECT_TRUE(plan.complete(BusResult()).has_value());
}
