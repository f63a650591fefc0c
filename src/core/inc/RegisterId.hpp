#ifndef REGIFACE_CORE_REGISTER_ID_HPP
#define REGIFACE_CORE_REGISTER_ID_HPP
/**
 * @file RegisterId.hpp
 * @brief Identifier widths usable as register and command ids.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * The set is closed: 8, 16, 32, 64 and 128-bit unsigned integers. Each one has
 * an infallible big-endian byte encoding, so encoding an id never fails.
 */

#include "src/core/inc/ByteCodec.hpp"

#include <concepts>
#include <cstdint>
#include <type_traits>

namespace regiface {

/* ----------------------------- RegisterId ----------------------------- */

/// Closed set of identifier types.
template <typename T>
concept RegisterId =
    std::same_as<T, std::uint8_t> || std::same_as<T, std::uint16_t> ||
    std::same_as<T, std::uint32_t> || std::same_as<T, std::uint64_t> || std::same_as<T, uint128_t>;

/// Wire form of an identifier.
template <RegisterId Id> using IdBytes = ByteArray<sizeof(Id)>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Encode an identifier to its big-endian wire form.
 * @param id Identifier value.
 * @return sizeof(Id) bytes, most significant first.
 * @note RT-safe: No allocation.
 */
template <RegisterId Id> [[nodiscard]] constexpr IdBytes<Id> encodeId(Id id) noexcept {
  static_assert(std::is_same_v<SerializeError<Id>, Infallible>,
                "identifier encoding must be infallible");
  // Infallible error type: the expected always holds a value.
  return ToByteArray<Id>::toBytes(id).value();
}

/**
 * @brief Set flag bits on an identifier.
 * @param id Base identifier.
 * @param mask Bits to OR into the id.
 * @return id | mask, in the id's own width.
 *
 * For devices that select the read opcode by setting a bit on the register id,
 * used from a register's readableId()/writeableId() override.
 */
template <RegisterId Id> [[nodiscard]] constexpr Id setBitId(Id id, Id mask) noexcept {
  return static_cast<Id>(id | mask);
}

} // namespace regiface

#endif // REGIFACE_CORE_REGISTER_ID_HPP
