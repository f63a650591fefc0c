#ifndef REGIFACE_TRANSFER_TRANSFER_PLAN_HPP
#define REGIFACE_TRANSFER_TRANSFER_PLAN_HPP
/**
 * @file TransferPlan.hpp
 * @brief Bus-agnostic steps shared by every register read, register write and command.
 * @note RT-safe: No allocation; all buffers live inside the plan.
 *
 * A plan owns the encoded id, the outbound payload and the response buffer for
 * one transaction. Blocking and async entry points both follow the same
 * sequence, differing only in how they call the bus:
 *
 *   1. prepare()     serialize the payload; fails before any bus access
 *   2. operations()  operation list pointing into the plan's buffers
 *   3. complete()    map the bus result; deserialize only after bus success
 *
 * Plans hand out spans into themselves: keep a plan in place (do not move it)
 * between operations() and complete().
 */

#include "src/bus/inc/Operation.hpp"
#include "src/core/inc/ByteArray.hpp"
#include "src/core/inc/ByteCodec.hpp"
#include "src/core/inc/Command.hpp"
#include "src/core/inc/Errors.hpp"
#include "src/core/inc/Register.hpp"
#include "src/core/inc/RegisterId.hpp"

#include <etl/expected.h>

#include <array>
#include <cstdint>
#include <span>
#include <utility>

namespace regiface {

namespace transfer {

/* ----------------------------- ReadPlan ----------------------------- */

/**
 * @brief Register read: [write id][read payload].
 * @tparam R Readable register type.
 */
template <ReadableRegister R> class ReadPlan {
public:
  template <typename B> using ErrorFor = ReadRegisterError<B, DeserializeError<R>>;

  constexpr ReadPlan() noexcept : id_(encodeId(readableId<R>())) {}

  ReadPlan(const ReadPlan&) = delete;
  ReadPlan& operator=(const ReadPlan&) = delete;

  /// Encoded readable id.
  [[nodiscard]] std::span<const std::uint8_t> idBytes() const noexcept { return id_; }

  /// Zero-filled buffer of exactly the payload length.
  [[nodiscard]] std::span<std::uint8_t> responseBuffer() noexcept { return buffer_; }

  /// [Write(id), Read(payload)] for buses without a combined write-read call.
  [[nodiscard]] std::array<bus::Operation, 2> operations() noexcept {
    return {bus::Operation::write(idBytes()), bus::Operation::read(responseBuffer())};
  }

  /**
   * @brief Finish the read once the bus call returned.
   * @param busResult Outcome of the bus transaction.
   * @return Decoded register, or the failing phase.
   */
  template <typename B>
  [[nodiscard]] etl::expected<R, ErrorFor<B>> complete(etl::expected<void, B> busResult) {
    if (!busResult.has_value()) {
      return etl::unexpected(ErrorFor<B>(BusError<B>{std::move(busResult).error()}));
    }

    auto decoded = deserialize<R>(buffer_);
    if (!decoded.has_value()) {
      return etl::unexpected(
          ErrorFor<B>(DeserializationError<DeserializeError<R>>{std::move(decoded).error()}));
    }
    return std::move(decoded).value();
  }

private:
  IdBytes<typename R::IdType> id_;
  InboundArray<R> buffer_{};
};

/* ----------------------------- WritePlan ----------------------------- */

/**
 * @brief Register write: [write id][write payload].
 * @tparam R Writable register type.
 */
template <WritableRegister R> class WritePlan {
public:
  template <typename B> using ErrorFor = WriteRegisterError<B, SerializeError<R>>;

  WritePlan(const WritePlan&) = delete;
  WritePlan& operator=(const WritePlan&) = delete;
  WritePlan(WritePlan&&) noexcept = default;
  WritePlan& operator=(WritePlan&&) = delete;

  /**
   * @brief Serialize the register value.
   * @tparam B Bus error type of the caller's driver.
   * @param reg Register value (consumed).
   * @return Ready plan, or a serialization error (the bus has not been touched).
   */
  template <typename B> [[nodiscard]] static etl::expected<WritePlan, ErrorFor<B>> prepare(R reg) {
    auto encoded = serialize<R>(std::move(reg));
    if (!encoded.has_value()) {
      return etl::unexpected(
          ErrorFor<B>(SerializationError<SerializeError<R>>{std::move(encoded).error()}));
    }
    return WritePlan(std::move(encoded).value());
  }

  [[nodiscard]] std::span<const std::uint8_t> idBytes() const noexcept { return id_; }

  [[nodiscard]] std::span<const std::uint8_t> payload() const noexcept { return payload_; }

  /// [Write(id), Write(payload)].
  [[nodiscard]] std::array<bus::Operation, 2> operations() const noexcept {
    return {bus::Operation::write(idBytes()), bus::Operation::write(payload())};
  }

  template <typename B>
  [[nodiscard]] etl::expected<void, ErrorFor<B>> complete(etl::expected<void, B> busResult) {
    if (!busResult.has_value()) {
      return etl::unexpected(ErrorFor<B>(BusError<B>{std::move(busResult).error()}));
    }
    return {};
  }

private:
  explicit WritePlan(OutboundArray<R> payload) noexcept
      : id_(encodeId(writeableId<R>())), payload_(payload) {}

  IdBytes<typename R::IdType> id_;
  OutboundArray<R> payload_;
};

/* ----------------------------- CommandPlan ----------------------------- */

/**
 * @brief Command invocation: [write id][write parameters][read response].
 * @tparam C Command type.
 */
template <Command C> class CommandPlan {
public:
  using Parameters = typename C::CommandParameters;
  using Response = typename C::ResponseParameters;

  template <typename B>
  using ErrorFor = CommandError<B, SerializeError<Parameters>, DeserializeError<Response>>;

  CommandPlan(const CommandPlan&) = delete;
  CommandPlan& operator=(const CommandPlan&) = delete;
  CommandPlan(CommandPlan&&) noexcept = default;
  CommandPlan& operator=(CommandPlan&&) = delete;

  /**
   * @brief Extract and serialize the command's parameters.
   * @param cmd Command value (consumed).
   * @return Ready plan, or a serialization error (the bus has not been touched).
   */
  template <typename B>
  [[nodiscard]] static etl::expected<CommandPlan, ErrorFor<B>> prepare(C cmd) {
    auto encoded = serialize<Parameters>(std::move(cmd).invokingParameters());
    if (!encoded.has_value()) {
      return etl::unexpected(
          ErrorFor<B>(SerializationError<SerializeError<Parameters>>{std::move(encoded).error()}));
    }
    return CommandPlan(std::move(encoded).value());
  }

  [[nodiscard]] std::span<const std::uint8_t> idBytes() const noexcept { return id_; }

  [[nodiscard]] std::span<const std::uint8_t> parameters() const noexcept { return parameters_; }

  [[nodiscard]] std::span<std::uint8_t> responseBuffer() noexcept { return response_; }

  /// [Write(id), Write(parameters), Read(response)].
  [[nodiscard]] std::array<bus::Operation, 3> operations() noexcept {
    return {bus::Operation::write(idBytes()), bus::Operation::write(parameters()),
            bus::Operation::read(responseBuffer())};
  }

  template <typename B>
  [[nodiscard]] etl::expected<Response, ErrorFor<B>> complete(etl::expected<void, B> busResult) {
    if (!busResult.has_value()) {
      return etl::unexpected(ErrorFor<B>(BusError<B>{std::move(busResult).error()}));
    }

    auto decoded = deserialize<Response>(response_);
    if (!decoded.has_value()) {
      return etl::unexpected(ErrorFor<B>(
          DeserializationError<DeserializeError<Response>>{std::move(decoded).error()}));
    }
    return std::move(decoded).value();
  }

private:
  explicit CommandPlan(OutboundArray<Parameters> parameters) noexcept
      : id_(encodeId(C::id())), parameters_(parameters) {}

  IdBytes<typename C::IdType> id_;
  OutboundArray<Parameters> parameters_;
  InboundArray<Response> response_{};
};

} // namespace transfer

} // namespace regiface

#endif // REGIFACE_TRANSFER_TRANSFER_PLAN_HPP
