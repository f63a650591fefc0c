#ifndef REGIFACE_CORE_BYTE_ARRAY_HPP
#define REGIFACE_CORE_BYTE_ARRAY_HPP
/**
 * @file ByteArray.hpp
 * @brief Fixed-length byte buffers used as the wire form of register payloads.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * The buffer length is part of the type, so a driver cannot hand a read buffer
 * of the wrong size to a register whose payload is N bytes long.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>

namespace regiface {

/* ----------------------------- ByteArray ----------------------------- */

/// Fixed-length byte buffer of N bytes.
template <std::size_t N> using ByteArray = std::array<std::uint8_t, N>;

namespace detail {

template <typename T> struct IsByteArrayImpl : std::false_type {};

template <std::size_t N> struct IsByteArrayImpl<std::array<std::uint8_t, N>> : std::true_type {
  static constexpr std::size_t SIZE = N;
};

} // namespace detail

/**
 * @brief Closed set of byte-array types.
 *
 * Only ByteArray<N> satisfies this concept; other containers are rejected at
 * compile time.
 */
template <typename T>
concept IsByteArray = detail::IsByteArrayImpl<std::remove_cv_t<T>>::value;

/// Length of a byte-array type.
template <IsByteArray T>
inline constexpr std::size_t BYTE_ARRAY_SIZE = detail::IsByteArrayImpl<std::remove_cv_t<T>>::SIZE;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Create a zero-filled buffer.
 * @tparam N Buffer length.
 * @note RT-safe: No allocation.
 */
template <std::size_t N> [[nodiscard]] constexpr ByteArray<N> makeByteArray() noexcept {
  return ByteArray<N>{};
}

/// @brief Read-only view of a buffer, for handing to bus drivers.
template <std::size_t N>
[[nodiscard]] constexpr std::span<const std::uint8_t, N>
asView(const ByteArray<N>& bytes) noexcept {
  return std::span<const std::uint8_t, N>(bytes);
}

/// @brief Mutable view of a buffer, for handing to bus drivers.
template <std::size_t N>
[[nodiscard]] constexpr std::span<std::uint8_t, N> asMutableView(ByteArray<N>& bytes) noexcept {
  return std::span<std::uint8_t, N>(bytes);
}

/**
 * @brief Format bytes for diagnostics (e.g., "[0x12, 0x34]").
 * @param bytes Bytes to format.
 * @return Bracketed, comma-separated hex list; "[]" when empty.
 * @note NOT RT-safe: Allocates std::string.
 */
[[nodiscard]] std::string toHexString(std::span<const std::uint8_t> bytes);

} // namespace regiface

#endif // REGIFACE_CORE_BYTE_ARRAY_HPP
