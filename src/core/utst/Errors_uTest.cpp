/**
 * @file Errors_uTest.cpp
 * @brief Unit tests for regiface error shapes and ErrorKind.
 */

#include "src/core/inc/Errors.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using regiface::BusError;
using regiface::CommandError;
using regiface::DeserializationError;
using regiface::ErrorKind;
using regiface::ReadRegisterError;
using regiface::SerializationError;
using regiface::toString;
using regiface::WriteRegisterError;

namespace {

struct DriverFault {
  int code{0};
  [[nodiscard]] std::string toString() const { return "fault " + std::to_string(code); }
};

struct Opaque {};

enum class SensorStatus : std::uint8_t {
  STUCK = 0,
  OVERRANGE,
};

const char* toString(SensorStatus status) noexcept {
  return status == SensorStatus::STUCK ? "STUCK" : "OVERRANGE";
}

} // namespace

/* ----------------------------- ErrorKind ----------------------------- */

/** @test Kind strings are stable. */
TEST(ErrorKindTest, ToString) {
  EXPECT_STREQ(toString(ErrorKind::BUS), "bus error");
  EXPECT_STREQ(toString(ErrorKind::SERIALIZATION), "serialization error");
  EXPECT_STREQ(toString(ErrorKind::DESERIALIZATION), "deserialization error");
}

/* ----------------------------- ReadRegisterError ----------------------------- */

/** @test Bus failure keeps its cause. */
TEST(ReadRegisterErrorTest, BusCause) {
  const ReadRegisterError<DriverFault, int> ERR = BusError<DriverFault>{DriverFault{5}};

  EXPECT_EQ(ERR.kind(), ErrorKind::BUS);
  ASSERT_NE(ERR.busError(), nullptr);
  EXPECT_EQ(ERR.busError()->code, 5);
  EXPECT_EQ(ERR.deserializationError(), nullptr);
  EXPECT_EQ(ERR.toString(), "bus error: fault 5");
}

/** @test Deserialization failure keeps its cause and reduces to its kind. */
TEST(ReadRegisterErrorTest, DeserializationCause) {
  const ReadRegisterError<DriverFault, int> ERR = DeserializationError<int>{7};

  const ErrorKind KIND = ERR;
  EXPECT_EQ(KIND, ErrorKind::DESERIALIZATION);
  ASSERT_NE(ERR.deserializationError(), nullptr);
  EXPECT_EQ(*ERR.deserializationError(), 7);
  EXPECT_EQ(ERR.busError(), nullptr);
  EXPECT_EQ(ERR.toString(), "deserialization error: 7");
}

/** @test A status-enum cause is rendered through its free toString(). */
TEST(ReadRegisterErrorTest, StatusEnumCause) {
  const ReadRegisterError<SensorStatus, SensorStatus> BUS =
      BusError<SensorStatus>{SensorStatus::STUCK};
  EXPECT_EQ(BUS.toString(), "bus error: STUCK");

  const ReadRegisterError<SensorStatus, SensorStatus> DESER =
      DeserializationError<SensorStatus>{SensorStatus::OVERRANGE};
  EXPECT_EQ(DESER.toString(), "deserialization error: OVERRANGE");
}

/* ----------------------------- WriteRegisterError ----------------------------- */

/** @test Serialization failure is distinguishable from bus failure. */
TEST(WriteRegisterErrorTest, Phases) {
  const WriteRegisterError<int, Opaque> SER = SerializationError<Opaque>{};
  EXPECT_EQ(SER.kind(), ErrorKind::SERIALIZATION);
  EXPECT_NE(SER.serializationError(), nullptr);
  EXPECT_EQ(SER.toString(), "serialization error");

  const WriteRegisterError<int, Opaque> BUS = BusError<int>{-5};
  EXPECT_EQ(BUS.kind(), ErrorKind::BUS);
  EXPECT_EQ(*BUS.busError(), -5);
  EXPECT_EQ(BUS.serializationError(), nullptr);
}

/* ----------------------------- CommandError ----------------------------- */

/** @test Command errors cover all three phases. */
TEST(CommandErrorTest, AllPhases) {
  using Error = CommandError<int, int, int>;

  const Error BUS = BusError<int>{1};
  const Error SER = SerializationError<int>{2};
  const Error DES = DeserializationError<int>{3};

  EXPECT_EQ(BUS.kind(), ErrorKind::BUS);
  EXPECT_EQ(SER.kind(), ErrorKind::SERIALIZATION);
  EXPECT_EQ(DES.kind(), ErrorKind::DESERIALIZATION);

  EXPECT_EQ(*BUS.busError(), 1);
  EXPECT_EQ(*SER.serializationError(), 2);
  EXPECT_EQ(*DES.deserializationError(), 3);
  EXPECT_EQ(DES.busError(), nullptr);
  EXPECT_EQ(DES.toString(), "deserialization error: 3");
}
