/*
 * Copyright (C) 2025 Agtonomy
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef TSINK_CORE_EVENT_LOOP_HPP_
#define TSINK_CORE_EVENT_LOOP_HPP_

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>

namespace tsink {
namespace core {

/**
 * @brief A shared handle to an asio::io_context with a running/stopped state
 *
 * Copies of an EventLoop refer to the same io_context, which lets sockets, timers and the thread driving the loop all
 * hold the same handle. A work guard keeps Run() from returning while the loop is idle, so the loop only leaves the
 * running state when Stop() is called.
 *
 * Notes on thread-safety: Run() and RunFor() should only be called from one thread at a time. Stop() may be called
 * from any thread.
 */
class EventLoop {
 public:
  enum class State { kStopped = 0, kRunning };
  using IOContext = asio::io_context;
  using IOContextPointer = std::shared_ptr<IOContext>;

  EventLoop() = default;

  /**
   * @brief Run handlers until Stop() is called
   */
  void Run() {
    state_->store(State::kRunning);
    io_context_->run();

    // Stop() may have raced with run(), so reconcile with the io_context
    if (io_context_->stopped()) {
      state_->store(State::kStopped);
    }
  }

  /**
   * @brief Run handlers for at most the given duration
   *
   * @return the number of handlers that were executed
   */
  template <typename Rep, typename Period>
  std::size_t RunFor(const std::chrono::duration<Rep, Period>& rel_time) {
    state_->store(State::kRunning);
    const auto retval = io_context_->run_for(rel_time);

    if (io_context_->stopped()) {
      state_->store(State::kStopped);
    }
    return retval;
  }

  /**
   * @brief Stop the loop, abandoning any handlers that have not run yet
   */
  void Stop() {
    io_context_->stop();
    state_->store(State::kStopped);
  }

  /**
   * @brief Check if the event loop is in the stopped state
   *
   * @return true if the event loop is in the stopped state, false otherwise
   */
  bool Stopped() const { return state_->load() == State::kStopped; }

  /**
   * @brief Return a reference to the underlying io_context
   *
   * This exists to pass the io_context into asio APIs such as asio::post() or socket constructors.
   *
   * @return IOContext& the underlying io context object
   */
  IOContext& operator*() const { return *io_context_; }

 private:
  std::shared_ptr<std::atomic<State>> state_ = std::make_shared<std::atomic<State>>(State::kStopped);
  IOContextPointer io_context_ = std::make_shared<IOContext>();
  asio::executor_work_guard<typename IOContext::executor_type> work_guard_{asio::make_work_guard(*io_context_)};
};

}  // namespace core
}  // namespace tsink

#endif  // TSINK_CORE_EVENT_LOOP_HPP_
