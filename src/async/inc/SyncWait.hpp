#ifndef REGIFACE_ASYNC_SYNC_WAIT_HPP
#define REGIFACE_ASYNC_SYNC_WAIT_HPP
/**
 * @file SyncWait.hpp
 * @brief Run a Task to completion from non-coroutine code.
 *
 * syncWait() starts the task on the calling thread and blocks until it
 * finishes. The task may be resumed from another thread (e.g., a driver's
 * completion callback); the caller still wakes exactly once.
 *
 * @warning Blocks the calling thread. Do not call from inside a coroutine or
 *          from the thread that must drive the bus driver's completions.
 */

#include "src/async/inc/Task.hpp"

#include <coroutine>
#include <exception>
#include <optional>
#include <semaphore>
#include <type_traits>
#include <utility>

namespace regiface {

namespace detail {

/* ----------------------------- SyncWaitTask ----------------------------- */

/**
 * Coroutine wrapper that signals a semaphore when it reaches its final suspend.
 */
class SyncWaitTask {
public:
  class promise_type {
  public:
    SyncWaitTask get_return_object() noexcept {
      return SyncWaitTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() const noexcept { return {}; }

    auto final_suspend() const noexcept {
      struct Notify {
        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<promise_type> self) const noexcept {
          self.promise().done_->release();
        }
        void await_resume() const noexcept {}
      };
      return Notify{};
    }

    void return_void() const noexcept {}

    void unhandled_exception() noexcept { exception_ = std::current_exception(); }

  private:
    friend class SyncWaitTask;

    std::binary_semaphore* done_{nullptr};
    std::exception_ptr exception_{};
  };

  explicit SyncWaitTask(std::coroutine_handle<promise_type> handle) noexcept : handle_(handle) {}

  SyncWaitTask(SyncWaitTask&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}
  SyncWaitTask(const SyncWaitTask&) = delete;
  SyncWaitTask& operator=(const SyncWaitTask&) = delete;
  SyncWaitTask& operator=(SyncWaitTask&&) = delete;

  ~SyncWaitTask() {
    if (handle_) {
      handle_.destroy();
    }
  }

  /// Resume on this thread, then block until the final suspend point is reached.
  void run() {
    std::binary_semaphore done{0};
    handle_.promise().done_ = &done;
    handle_.resume();
    done.acquire();
    if (handle_.promise().exception_) {
      std::rethrow_exception(handle_.promise().exception_);
    }
  }

private:
  std::coroutine_handle<promise_type> handle_{};
};

template <typename T> SyncWaitTask makeSyncWaitTask(Task<T>& task, std::optional<T>& out) {
  out.emplace(co_await std::move(task));
}

inline SyncWaitTask makeSyncWaitTask(Task<void>& task) { co_await std::move(task); }

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Block until a task completes and return its result.
 * @param task Task to run (consumed).
 * @return Value produced by the task.
 */
template <typename T>
  requires(!std::is_void_v<T>)
[[nodiscard]] T syncWait(Task<T> task) {
  std::optional<T> out;
  detail::makeSyncWaitTask(task, out).run();
  return std::move(*out);
}

/// @brief Block until a void task completes.
inline void syncWait(Task<void> task) { detail::makeSyncWaitTask(task).run(); }

} // namespace regiface

#endif // REGIFACE_ASYNC_SYNC_WAIT_HPP
