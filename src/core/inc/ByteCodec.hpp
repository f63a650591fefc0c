#ifndef REGIFACE_CORE_BYTE_CODEC_HPP
#define REGIFACE_CORE_BYTE_CODEC_HPP
/**
 * @file ByteCodec.hpp
 * @brief Serialization contracts between typed payloads and fixed-length byte arrays.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * A payload type opts in by specializing FromByteArray<T> and/or ToByteArray<T>:
 *
 * @code
 * template <> struct regiface::FromByteArray<Temperature> {
 *   using Array = regiface::ByteArray<2>;
 *   using Error = TemperatureError;
 *   static etl::expected<Temperature, Error> fromBytes(const Array& bytes) noexcept;
 * };
 * @endcode
 *
 * Each direction picks its own array length and error type. The unsigned
 * integer widths are provided here, big-endian and infallible.
 */

#include "src/core/inc/ByteArray.hpp"

#include <etl/expected.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace regiface {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Error type of conversions that cannot fail.
 *
 * Not constructible, so an etl::expected<T, Infallible> always holds a value.
 */
struct Infallible {
  Infallible() = delete;
};

/// 128-bit unsigned integer (GCC/Clang extension).
__extension__ typedef unsigned __int128 uint128_t;

/* ----------------------------- Customization Points ----------------------------- */

/**
 * @brief Deserialization hook: ByteArray<N> -> T.
 *
 * Specializations provide `Array`, `Error` and
 * `static etl::expected<T, Error> fromBytes(const Array&)`.
 */
template <typename T> struct FromByteArray {};

/**
 * @brief Serialization hook: T -> ByteArray<N>.
 *
 * Specializations provide `Array`, `Error` and
 * `static etl::expected<Array, Error> toBytes(T)`. The value is consumed.
 */
template <typename T> struct ToByteArray {};

/* ----------------------------- Concepts ----------------------------- */

/// T can be produced from a fixed-length byte array.
template <typename T>
concept Deserializable = requires(const typename FromByteArray<T>::Array& bytes) {
  requires IsByteArray<typename FromByteArray<T>::Array>;
  typename FromByteArray<T>::Error;
  {
    FromByteArray<T>::fromBytes(bytes)
  } -> std::same_as<etl::expected<T, typename FromByteArray<T>::Error>>;
};

/// T can be turned into a fixed-length byte array.
template <typename T>
concept Serializable = requires(T value) {
  requires IsByteArray<typename ToByteArray<T>::Array>;
  typename ToByteArray<T>::Error;
  {
    ToByteArray<T>::toBytes(std::move(value))
  } -> std::same_as<etl::expected<typename ToByteArray<T>::Array, typename ToByteArray<T>::Error>>;
};

template <Deserializable T> using InboundArray = typename FromByteArray<T>::Array;
template <Deserializable T> using DeserializeError = typename FromByteArray<T>::Error;
template <Serializable T> using OutboundArray = typename ToByteArray<T>::Array;
template <Serializable T> using SerializeError = typename ToByteArray<T>::Error;

/* ----------------------------- API ----------------------------- */

/// @brief Decode a value from its wire form.
template <Deserializable T>
[[nodiscard]] etl::expected<T, DeserializeError<T>> deserialize(const InboundArray<T>& bytes) {
  return FromByteArray<T>::fromBytes(bytes);
}

/// @brief Encode a value into its wire form, consuming it.
template <Serializable T>
[[nodiscard]] etl::expected<OutboundArray<T>, SerializeError<T>> serialize(T value) {
  return ToByteArray<T>::toBytes(std::move(value));
}

/* ----------------------------- Built-in Integer Codecs ----------------------------- */

namespace detail {

/**
 * Big-endian codec for unsigned integers.
 */
template <typename U> struct BigEndianCodec {
  using Array = ByteArray<sizeof(U)>;
  using Error = Infallible;

  static etl::expected<U, Infallible> fromBytes(const Array& bytes) noexcept {
    U value = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
      value = static_cast<U>(static_cast<U>(value << 8) | bytes[i]);
    }
    return value;
  }

  static etl::expected<Array, Infallible> toBytes(U value) noexcept {
    Array out{};
    for (std::size_t i = 0; i < sizeof(U); ++i) {
      out[sizeof(U) - 1 - i] = static_cast<std::uint8_t>(value & 0xFFU);
      value = static_cast<U>(value >> 8);
    }
    return out;
  }
};

} // namespace detail

template <> struct FromByteArray<std::uint8_t> : detail::BigEndianCodec<std::uint8_t> {};
template <> struct FromByteArray<std::uint16_t> : detail::BigEndianCodec<std::uint16_t> {};
template <> struct FromByteArray<std::uint32_t> : detail::BigEndianCodec<std::uint32_t> {};
template <> struct FromByteArray<std::uint64_t> : detail::BigEndianCodec<std::uint64_t> {};
template <> struct FromByteArray<uint128_t> : detail::BigEndianCodec<uint128_t> {};

template <> struct ToByteArray<std::uint8_t> : detail::BigEndianCodec<std::uint8_t> {};
template <> struct ToByteArray<std::uint16_t> : detail::BigEndianCodec<std::uint16_t> {};
template <> struct ToByteArray<std::uint32_t> : detail::BigEndianCodec<std::uint32_t> {};
template <> struct ToByteArray<std::uint64_t> : detail::BigEndianCodec<std::uint64_t> {};
template <> struct ToByteArray<uint128_t> : detail::BigEndianCodec<uint128_t> {};

} // namespace regiface

#endif // REGIFACE_CORE_BYTE_CODEC_HPP
