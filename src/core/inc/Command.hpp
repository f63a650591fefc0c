#ifndef REGIFACE_CORE_COMMAND_HPP
#define REGIFACE_CORE_COMMAND_HPP
/**
 * @file Command.hpp
 * @brief Command contract: invoke with parameters, receive a response.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * A command carries its parameters as state and hands them over when invoked:
 *
 * @code
 * struct GetTemperature {
 *   using IdType = std::uint8_t;
 *   using CommandParameters = regiface::NoParameters;
 *   using ResponseParameters = Temperature;
 *
 *   static constexpr IdType id() noexcept { return 0x42; }
 *   CommandParameters invokingParameters() && { return {}; }
 * };
 * @endcode
 */

#include "src/core/inc/ByteCodec.hpp"
#include "src/core/inc/RegisterId.hpp"

#include <concepts>
#include <cstddef>
#include <utility>

namespace regiface {

/* ----------------------------- Command ----------------------------- */

/// C names an invokable command with serializable parameters and a decodable response.
template <typename C>
concept Command = requires(C cmd) {
  typename C::IdType;
  typename C::CommandParameters;
  typename C::ResponseParameters;
  requires RegisterId<typename C::IdType>;
  requires Serializable<typename C::CommandParameters>;
  requires Deserializable<typename C::ResponseParameters>;
  { C::id() } -> std::same_as<typename C::IdType>;
  { std::move(cmd).invokingParameters() } -> std::same_as<typename C::CommandParameters>;
};

/* ----------------------------- NoParameters ----------------------------- */

/**
 * @brief Empty payload, for commands without parameters or without a response.
 *
 * Encodes to zero bytes and decodes from zero bytes.
 */
struct NoParameters {
  friend constexpr bool operator==(NoParameters, NoParameters) noexcept { return true; }
};

template <> struct ToByteArray<NoParameters> {
  using Array = ByteArray<0>;
  using Error = Infallible;

  static etl::expected<Array, Infallible> toBytes(NoParameters) noexcept {
    return Array{};
  }
};

template <> struct FromByteArray<NoParameters> {
  using Array = ByteArray<0>;
  using Error = Infallible;

  static etl::expected<NoParameters, Infallible> fromBytes(const Array&) noexcept {
    return NoParameters{};
  }
};

/* ----------------------------- Zeros ----------------------------- */

/**
 * @brief Parameter payload of N zero bytes.
 * @tparam N Number of zero bytes sent.
 */
template <std::size_t N = 0> struct Zeros {
  friend constexpr bool operator==(Zeros, Zeros) noexcept { return true; }
};

template <std::size_t N> struct ToByteArray<Zeros<N>> {
  using Array = ByteArray<N>;
  using Error = Infallible;

  static etl::expected<Array, Infallible> toBytes(Zeros<N>) noexcept {
    return makeByteArray<N>();
  }
};

} // namespace regiface

#endif // REGIFACE_CORE_COMMAND_HPP
