/**
 * @file RegisterId_uTest.cpp
 * @brief Unit tests for regiface::RegisterId encoding.
 */

#include "src/core/inc/RegisterId.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using regiface::ByteArray;
using regiface::encodeId;
using regiface::IdBytes;
using regiface::RegisterId;
using regiface::setBitId;
using regiface::uint128_t;

static_assert(RegisterId<std::uint8_t>);
static_assert(RegisterId<std::uint16_t>);
static_assert(RegisterId<std::uint32_t>);
static_assert(RegisterId<std::uint64_t>);
static_assert(RegisterId<uint128_t>);
static_assert(!RegisterId<std::int16_t>);
static_assert(!RegisterId<int>);
static_assert(!RegisterId<bool>);
static_assert(sizeof(IdBytes<std::uint32_t>) == 4);

/** @test Each width encodes to exactly its size, most significant byte first. */
TEST(RegisterIdTest, EncodeWidths) {
  EXPECT_EQ(encodeId<std::uint8_t>(0x2A), (ByteArray<1>{0x2A}));
  EXPECT_EQ(encodeId<std::uint16_t>(0x1234), (ByteArray<2>{0x12, 0x34}));
  EXPECT_EQ(encodeId<std::uint32_t>(0x00C0FFEE), (ByteArray<4>{0x00, 0xC0, 0xFF, 0xEE}));
  EXPECT_EQ(encodeId<std::uint64_t>(0x1ULL), (ByteArray<8>{0, 0, 0, 0, 0, 0, 0, 0x01}));

  const ByteArray<16> WIDE = encodeId(static_cast<uint128_t>(1) << 120);
  EXPECT_EQ(WIDE[0], 0x01U);
  for (std::size_t i = 1; i < WIDE.size(); ++i) {
    EXPECT_EQ(WIDE[i], 0U);
  }
}

/** @test Encoding is usable at compile time. */
TEST(RegisterIdTest, ConstexprEncode) {
  constexpr auto BYTES = encodeId<std::uint16_t>(0xABCD);
  static_assert(BYTES[0] == 0xAB && BYTES[1] == 0xCD);
  SUCCEED();
}

/** @test setBitId ORs the mask in the id's own width. */
TEST(RegisterIdTest, SetBit) {
  EXPECT_EQ(setBitId<std::uint8_t>(0x0F, 0x80), 0x8FU);
  EXPECT_EQ(setBitId<std::uint16_t>(0x0102, 0x8000), 0x8102U);
  EXPECT_EQ(setBitId<std::uint8_t>(0x80, 0x80), 0x80U);
}
