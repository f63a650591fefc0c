#ifndef REGIFACE_CORE_REGISTER_HPP
#define REGIFACE_CORE_REGISTER_HPP
/**
 * @file Register.hpp
 * @brief Register contracts: identity plus readable/writable capabilities.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * A register type declares its id width and id as static members:
 *
 * @code
 * struct Status {
 *   using IdType = std::uint8_t;
 *   static constexpr IdType id() noexcept { return 0x2A; }
 *   std::uint8_t flags{0};
 * };
 * @endcode
 *
 * It becomes readable by specializing FromByteArray<Status>, and writable by
 * specializing ToByteArray<Status>. When the device uses a different opcode
 * for reads or writes, the type may also declare
 * `static constexpr IdType readableId() noexcept` and/or `writeableId()`.
 */

#include "src/core/inc/ByteCodec.hpp"
#include "src/core/inc/RegisterId.hpp"

#include <concepts>

namespace regiface {

/* ----------------------------- Concepts ----------------------------- */

/// R names an addressable register with a constant identifier.
template <typename R>
concept Register = requires {
  typename R::IdType;
  requires RegisterId<typename R::IdType>;
  { R::id() } -> std::same_as<typename R::IdType>;
};

/// Register whose value can be decoded from its payload bytes.
template <typename R>
concept ReadableRegister = Register<R> && Deserializable<R>;

/// Register whose value can be encoded into its payload bytes.
template <typename R>
concept WritableRegister = Register<R> && Serializable<R>;

namespace detail {

/// R has a member named readableId, whatever its signature.
template <typename R>
concept DeclaresReadableId = requires { &R::readableId; };

/// R::readableId() is callable without an object and yields R::IdType.
template <typename R>
concept HasReadableId = requires {
  { R::readableId() } -> std::same_as<typename R::IdType>;
};

/// R has a member named writeableId, whatever its signature.
template <typename R>
concept DeclaresWriteableId = requires { &R::writeableId; };

/// R::writeableId() is callable without an object and yields R::IdType.
template <typename R>
concept HasWriteableId = requires {
  { R::writeableId() } -> std::same_as<typename R::IdType>;
};

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Id placed on the wire when reading R.
 * @return R::readableId() if declared, otherwise R::id().
 *
 * A readableId member with any other signature is a compile error, never a
 * silent fallback to id().
 */
template <ReadableRegister R> [[nodiscard]] constexpr typename R::IdType readableId() noexcept {
  if constexpr (detail::DeclaresReadableId<R>) {
    static_assert(detail::HasReadableId<R>,
                  "readableId() must be a static member function returning IdType");
    return R::readableId();
  } else {
    return R::id();
  }
}

/**
 * @brief Id placed on the wire when writing R.
 * @return R::writeableId() if declared, otherwise R::id().
 */
template <WritableRegister R> [[nodiscard]] constexpr typename R::IdType writeableId() noexcept {
  if constexpr (detail::DeclaresWriteableId<R>) {
    static_assert(detail::HasWriteableId<R>,
                  "writeableId() must be a static member function returning IdType");
    return R::writeableId();
  } else {
    return R::id();
  }
}

} // namespace regiface

#endif // REGIFACE_CORE_REGISTER_HPP
