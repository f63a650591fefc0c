#ifndef REGIFACE_CORE_ERRORS_HPP
#define REGIFACE_CORE_ERRORS_HPP
/**
 * @file Errors.hpp
 * @brief Error shapes returned by register reads, register writes and commands.
 * @note Thread-safe: All types are plain values.
 *
 * Each shape records which phase failed and carries the underlying cause:
 *  - ReadRegisterError:  bus | deserialization
 *  - WriteRegisterError: bus | serialization
 *  - CommandError:       bus | serialization | deserialization
 *
 * Every shape converts to ErrorKind for callers that only need the category.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>

namespace regiface {

/* ----------------------------- ErrorKind ----------------------------- */

/**
 * @brief Failure category, without the underlying cause.
 */
enum class ErrorKind : std::uint8_t {
  BUS = 0,         ///< Bus driver reported a failure
  SERIALIZATION,   ///< Outbound payload could not be encoded
  DESERIALIZATION, ///< Inbound bytes could not be decoded
};

/**
 * @brief Human-readable kind string.
 * @note RT-safe: Returns static string pointer.
 */
[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

/* ----------------------------- Cause Tags ----------------------------- */

/// Failure reported by the bus driver.
template <typename E> struct BusError {
  E cause;
};

/// Failure encoding the outbound payload.
template <typename E> struct SerializationError {
  E cause;
};

/// Failure decoding the inbound payload.
template <typename E> struct DeserializationError {
  E cause;
};

namespace detail {

/**
 * "<kind>: <cause>" when the cause can be rendered, otherwise "<kind>".
 * A cause renders through fmt, a toString() member, or a free toString(cause)
 * found by argument-dependent lookup (the status-enum convention).
 */
template <typename E> std::string describe(ErrorKind kind, const E& cause) {
  if constexpr (fmt::is_formattable<E>::value) {
    return fmt::format("{}: {}", toString(kind), cause);
  } else if constexpr (requires { cause.toString(); }) {
    return fmt::format("{}: {}", toString(kind), cause.toString());
  } else if constexpr (requires { toString(cause); }) {
    return fmt::format("{}: {}", toString(kind), toString(cause));
  } else {
    return std::string(toString(kind));
  }
}

} // namespace detail

/* ----------------------------- ReadRegisterError ----------------------------- */

/**
 * @brief Failure of a register read.
 * @tparam B Bus driver error type.
 * @tparam D Payload deserialization error type.
 */
template <typename B, typename D> class ReadRegisterError {
public:
  using BusErrorType = B;
  using DeserializationErrorType = D;

  ReadRegisterError(BusError<B> err) : cause_(std::in_place_index<0>, std::move(err)) {}
  ReadRegisterError(DeserializationError<D> err) : cause_(std::in_place_index<1>, std::move(err)) {}

  [[nodiscard]] ErrorKind kind() const noexcept {
    return cause_.index() == 0 ? ErrorKind::BUS : ErrorKind::DESERIALIZATION;
  }

  /// Reduced, cause-free view.
  operator ErrorKind() const noexcept { return kind(); }

  /// @return Bus cause, or nullptr if another phase failed.
  [[nodiscard]] const B* busError() const noexcept {
    const auto* err = std::get_if<0>(&cause_);
    return err != nullptr ? &err->cause : nullptr;
  }

  /// @return Deserialization cause, or nullptr if another phase failed.
  [[nodiscard]] const D* deserializationError() const noexcept {
    const auto* err = std::get_if<1>(&cause_);
    return err != nullptr ? &err->cause : nullptr;
  }

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const {
    if (const B* bus = busError()) {
      return detail::describe(ErrorKind::BUS, *bus);
    }
    return detail::describe(ErrorKind::DESERIALIZATION, *deserializationError());
  }

private:
  std::variant<BusError<B>, DeserializationError<D>> cause_;
};

/* ----------------------------- WriteRegisterError ----------------------------- */

/**
 * @brief Failure of a register write.
 * @tparam B Bus driver error type.
 * @tparam S Payload serialization error type.
 */
template <typename B, typename S> class WriteRegisterError {
public:
  using BusErrorType = B;
  using SerializationErrorType = S;

  WriteRegisterError(BusError<B> err) : cause_(std::in_place_index<0>, std::move(err)) {}
  WriteRegisterError(SerializationError<S> err) : cause_(std::in_place_index<1>, std::move(err)) {}

  [[nodiscard]] ErrorKind kind() const noexcept {
    return cause_.index() == 0 ? ErrorKind::BUS : ErrorKind::SERIALIZATION;
  }

  operator ErrorKind() const noexcept { return kind(); }

  [[nodiscard]] const B* busError() const noexcept {
    const auto* err = std::get_if<0>(&cause_);
    return err != nullptr ? &err->cause : nullptr;
  }

  [[nodiscard]] const S* serializationError() const noexcept {
    const auto* err = std::get_if<1>(&cause_);
    return err != nullptr ? &err->cause : nullptr;
  }

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const {
    if (const B* bus = busError()) {
      return detail::describe(ErrorKind::BUS, *bus);
    }
    return detail::describe(ErrorKind::SERIALIZATION, *serializationError());
  }

private:
  std::variant<BusError<B>, SerializationError<S>> cause_;
};

/* ----------------------------- CommandError ----------------------------- */

/**
 * @brief Failure of a command invocation.
 * @tparam B Bus driver error type.
 * @tparam S Parameter serialization error type.
 * @tparam D Response deserialization error type.
 */
template <typename B, typename S, typename D> class CommandError {
public:
  using BusErrorType = B;
  using SerializationErrorType = S;
  using DeserializationErrorType = D;

  CommandError(BusError<B> err) : cause_(std::in_place_index<0>, std::move(err)) {}
  CommandError(SerializationError<S> err) : cause_(std::in_place_index<1>, std::move(err)) {}
  CommandError(DeserializationError<D> err) : cause_(std::in_place_index<2>, std::move(err)) {}

  [[nodiscard]] ErrorKind kind() const noexcept {
    switch (cause_.index()) {
    case 0:
      return ErrorKind::BUS;
    case 1:
      return ErrorKind::SERIALIZATION;
    default:
      return ErrorKind::DESERIALIZATION;
    }
  }

  operator ErrorKind() const noexcept { return kind(); }

  [[nodiscard]] const B* busError() const noexcept {
    const auto* err = std::get_if<0>(&cause_);
    return err != nullptr ? &err->cause : nullptr;
  }

  [[nodiscard]] const S* serializationError() const noexcept {
    const auto* err = std::get_if<1>(&cause_);
    return err != nullptr ? &err->cause : nullptr;
  }

  [[nodiscard]] const D* deserializationError() const noexcept {
    const auto* err = std::get_if<2>(&cause_);
    return err != nullptr ? &err->cause : nullptr;
  }

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const {
    if (const B* bus = busError()) {
      return detail::describe(ErrorKind::BUS, *bus);
    }
    if (const S* ser = serializationError()) {
      return detail::describe(ErrorKind::SERIALIZATION, *ser);
    }
    return detail::describe(ErrorKind::DESERIALIZATION, *deserializationError());
  }

private:
  std::variant<BusError<B>, SerializationError<S>, DeserializationError<D>> cause_;
};

} // namespace regiface

#endif // REGIFACE_CORE_ERRORS_HPP
