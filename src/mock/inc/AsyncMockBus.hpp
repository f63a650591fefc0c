#ifndef REGIFACE_MOCK_ASYNC_MOCK_BUS_HPP
#define REGIFACE_MOCK_ASYNC_MOCK_BUS_HPP
/**
 * @file AsyncMockBus.hpp
 * @brief MockBus base for the async doubles, with optional worker-thread completion.
 * @note Not thread-safe: One caller at a time.
 * @note NOT RT-safe: Starts a thread and allocates for call records.
 *
 * With completeOnWorkerThread(true) each call suspends and is resumed from a
 * single worker thread, as an interrupt-driven driver would. The worker is
 * started on first use and reused for every later call, including calls
 * issued from code that is itself running on the worker.
 */

#include "src/mock/inc/MockBus.hpp"

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace regiface {

namespace mock {

/* ----------------------------- ResumeQueue ----------------------------- */

/**
 * @brief One worker thread resuming posted coroutines in FIFO order.
 *
 * Handles posted while the worker is busy run after the current one returns.
 * Destruction drains the queue, then joins the worker.
 */
class ResumeQueue {
public:
  ResumeQueue() = default;
  ResumeQueue(const ResumeQueue&) = delete;
  ResumeQueue& operator=(const ResumeQueue&) = delete;
  ~ResumeQueue();

  /// @brief Queue `waiting` for resumption on the worker, starting it if needed.
  void post(std::coroutine_handle<> waiting);

  /// @brief Worker threads started over the queue's lifetime (0 or 1).
  [[nodiscard]] std::size_t threadsStarted() const;

private:
  void run();

  mutable std::mutex mutex_{};
  std::condition_variable ready_{};
  std::deque<std::coroutine_handle<>> pending_{};
  bool stopping_{false};
  std::size_t started_{0};
  std::thread worker_{};
};

/* ----------------------------- AsyncMockBus ----------------------------- */

/**
 * @brief Expectation engine plus the suspension point shared by async doubles.
 */
class AsyncMockBus : public MockBus {
public:
  AsyncMockBus() = default;
  explicit AsyncMockBus(std::vector<Expectation> expectations)
      : MockBus(std::move(expectations)) {}

  /// @brief Resume callers from the worker thread instead of inline.
  void completeOnWorkerThread(bool enable) noexcept { useWorker_ = enable; }

  /// @brief Worker threads started so far; never more than one.
  [[nodiscard]] std::size_t workerThreadsStarted() const {
    return resumer_.threadsStarted();
  }

protected:
  /// Awaiter that suspends onto the worker when worker completion is enabled.
  struct Completion {
    AsyncMockBus* self;

    bool await_ready() const noexcept { return !self->useWorker_; }

    void await_suspend(std::coroutine_handle<> waiting) { self->resumer_.post(waiting); }

    void await_resume() const noexcept {}
  };

  [[nodiscard]] Completion completion() noexcept { return Completion{this}; }

private:
  bool useWorker_{false};
  ResumeQueue resumer_{};
};

} // namespace mock

} // namespace regiface

#endif // REGIFACE_MOCK_ASYNC_MOCK_BUS_HPP
