/**
 * @file AsyncMockBus.cpp
 * @brief ResumeQueue worker loop.
 */

#include "src/mock/inc/AsyncMockBus.hpp"

namespace regiface {

namespace mock {

/* ----------------------------- ResumeQueue ----------------------------- */

ResumeQueue::~ResumeQueue() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  ready_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void ResumeQueue::post(std::coroutine_handle<> waiting) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(waiting);
    if (!worker_.joinable()) {
      worker_ = std::thread([this]() { run(); });
      ++started_;
    }
  }
  ready_.notify_one();
}

std::size_t ResumeQueue::threadsStarted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_;
}

void ResumeQueue::run() {
  for (;;) {
    std::coroutine_handle<> next;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      ready_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      next = pending_.front();
      pending_.pop_front();
    }
    // Unlocked: the resumed caller may post again from this thread
    next.resume();
  }
}

} // namespace mock

} // namespace regiface
