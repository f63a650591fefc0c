#ifndef REGIFACE_ASYNC_TASK_HPP
#define REGIFACE_ASYNC_TASK_HPP
/**
 * @file Task.hpp
 * @brief Lazily started coroutine result type for the async transaction API.
 * @note Not thread-safe: A Task is owned and awaited by exactly one caller.
 *
 * A Task<T> does not run until it is co_awaited (or handed to syncWait()). When
 * it finishes, control transfers directly back to the awaiting coroutine, so a
 * chain of Tasks adds no suspension points of its own: it suspends only where
 * an awaited bus operation suspends.
 */

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace regiface {

template <typename T> class Task;

namespace detail {

/* ----------------------------- Promise ----------------------------- */

/**
 * Shared promise state: continuation and captured exception.
 */
class TaskPromiseBase {
public:
  struct FinalAwaiter {
    bool await_ready() const noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> self) noexcept {
      return self.promise().continuation();
    }

    void await_resume() const noexcept {}
  };

  std::suspend_always initial_suspend() const noexcept { return {}; }
  FinalAwaiter final_suspend() const noexcept { return {}; }

  void unhandled_exception() noexcept { exception_ = std::current_exception(); }

  void setContinuation(std::coroutine_handle<> continuation) noexcept {
    continuation_ = continuation;
  }

  [[nodiscard]] std::coroutine_handle<> continuation() const noexcept { return continuation_; }

protected:
  void rethrowIfFailed() const {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }

private:
  std::coroutine_handle<> continuation_{std::noop_coroutine()};
  std::exception_ptr exception_{};
};

template <typename T> class TaskPromise final : public TaskPromiseBase {
public:
  Task<T> get_return_object() noexcept;

  template <typename U>
    requires std::is_constructible_v<T, U&&>
  void return_value(U&& value) {
    value_.emplace(std::forward<U>(value));
  }

  T result() {
    rethrowIfFailed();
    return std::move(*value_);
  }

private:
  std::optional<T> value_{};
};

template <> class TaskPromise<void> final : public TaskPromiseBase {
public:
  Task<void> get_return_object() noexcept;

  void return_void() const noexcept {}

  void result() const { rethrowIfFailed(); }
};

} // namespace detail

/* ----------------------------- Task ----------------------------- */

/**
 * @brief Coroutine producing a T when awaited.
 * @tparam T Result type (may be void).
 */
template <typename T> class [[nodiscard]] Task {
public:
  using promise_type = detail::TaskPromise<T>;
  using HandleType = std::coroutine_handle<promise_type>;

  explicit Task(HandleType handle) noexcept : handle_(handle) {}

  Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}

  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      destroy();
      handle_ = std::exchange(other.handle_, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { destroy(); }

  /// @brief True once the coroutine has run to completion.
  [[nodiscard]] bool done() const noexcept { return !handle_ || handle_.done(); }

  /**
   * @brief Start the task and suspend the awaiting coroutine until it finishes.
   * @note The Task must outlive the co_await expression (true for temporaries).
   */
  auto operator co_await() && noexcept {
    struct Awaiter {
      HandleType handle;

      bool await_ready() const noexcept { return !handle || handle.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        handle.promise().setContinuation(awaiting);
        return handle;
      }

      T await_resume() { return handle.promise().result(); }
    };
    return Awaiter{handle_};
  }

private:
  void destroy() noexcept {
    if (handle_) {
      handle_.destroy();
      handle_ = {};
    }
  }

  HandleType handle_{};
};

namespace detail {

template <typename T> Task<T> TaskPromise<T>::get_return_object() noexcept {
  return Task<T>{std::coroutine_handle<TaskPromise<T>>::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
  return Task<void>{std::coroutine_handle<TaskPromise<void>>::from_promise(*this)};
}

} // namespace detail

/* ----------------------------- Awaitable Traits ----------------------------- */

namespace detail {

template <typename A> struct AwaiterOf {
  using type = A;
};

template <typename A>
  requires requires(A&& awaitable) { std::forward<A>(awaitable).operator co_await(); }
struct AwaiterOf<A> {
  using type = decltype(std::declval<A>().operator co_await());
};

} // namespace detail

/// Awaiter obtained when co_awaiting a prvalue of type A.
template <typename A> using AwaiterT = typename detail::AwaiterOf<A>::type;

/// A can be co_awaited.
template <typename A>
concept Awaitable = requires(AwaiterT<A>& awaiter) {
  { awaiter.await_ready() } -> std::convertible_to<bool>;
  awaiter.await_resume();
};

/// Type produced by co_awaiting a prvalue of type A.
template <Awaitable A>
using AwaitResultT = decltype(std::declval<AwaiterT<A>&>().await_resume());

/// A can be co_awaited and yields exactly R.
template <typename A, typename R>
concept AwaitableOf = Awaitable<A> && std::same_as<std::remove_cvref_t<AwaitResultT<A>>, R>;

} // namespace regiface

#endif // REGIFACE_ASYNC_TASK_HPP
