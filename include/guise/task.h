// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TASK_H_
#define GUISE_TASK_H_

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstdlib>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

#include "guise/error.h"

namespace guise {

template <typename T>
class Task;

namespace detail {

// Resumes whoever awaited the finished task, or parks if nobody did.
struct ContinuationAwaiter {
  bool await_ready() noexcept { return false; }

  template <typename Promise>
  std::coroutine_handle<> await_suspend(
      std::coroutine_handle<Promise> h) noexcept {
    if (h.promise().continuation_) {
      return h.promise().continuation_;
    }
    return std::noop_coroutine();
  }

  void await_resume() noexcept {}
};

template <typename T>
struct TaskPromiseBase {
  std::coroutine_handle<> continuation_;

  // Lazily started: the task runs on first co_await or Start()
  std::suspend_always initial_suspend() noexcept { return {}; }
  ContinuationAwaiter final_suspend() noexcept { return {}; }

  // Library code reports failures through Result<T>; a throw here is a bug
  [[noreturn]] void unhandled_exception() noexcept { std::abort(); }
};

template <typename T>
struct TaskPromise : TaskPromiseBase<T> {
  std::optional<T> value_;

  Task<T> get_return_object() noexcept;

  void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
    value_.emplace(std::move(value));
  }

  T&& result() && { return std::move(*value_); }
};

template <>
struct TaskPromise<void> : TaskPromiseBase<void> {
  Task<void> get_return_object() noexcept;

  void return_void() noexcept {}
  void result() && noexcept {}
};

}  // namespace detail

// Task<T> - lazily started coroutine producing a T.
//
// Usage:
//   Task<int> FetchStatus(AsyncClient& client) {
//     auto result = co_await client.Get("https://example.com");
//     co_return result ? result.value().status_code : -1;
//   }
//
// Top-level tasks are driven with Start() plus an event loop (see RunAsync).
template <typename T = void>
class Task {
 public:
  using promise_type = detail::TaskPromise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  Task() noexcept : handle_(nullptr) {}
  explicit Task(handle_type h) noexcept : handle_(h) {}

  Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      Reset();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { Reset(); }

  explicit operator bool() const noexcept { return handle_ != nullptr; }

  auto operator co_await() const& noexcept {
    struct Awaiter {
      handle_type handle_;

      bool await_ready() noexcept { return false; }

      std::coroutine_handle<> await_suspend(
          std::coroutine_handle<> continuation) noexcept {
        handle_.promise().continuation_ = continuation;
        return handle_;
      }

      decltype(auto) await_resume() {
        return std::move(handle_.promise()).result();
      }
    };
    return Awaiter{handle_};
  }

  // Runs the task until its first suspension point
  void Start() {
    if (handle_ && !handle_.done()) {
      handle_.resume();
    }
  }

  bool done() const noexcept { return handle_ && handle_.done(); }

  // Only valid once done() is true
  decltype(auto) result() { return std::move(handle_.promise()).result(); }

 private:
  void Reset() noexcept {
    if (handle_) {
      handle_.destroy();
      handle_ = nullptr;
    }
  }

  handle_type handle_;
};

namespace detail {

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
  return Task<T>{std::coroutine_handle<TaskPromise<T>>::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
  return Task<void>{
      std::coroutine_handle<TaskPromise<void>>::from_promise(*this)};
}

}  // namespace detail

// Coroutines woken from reactor threads are queued here and resumed on the
// thread that calls Drain(), so coroutine bodies never run concurrently.
class ResumeQueue {
 public:
  void Push(std::coroutine_handle<> handle) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(handle);
    }
    cv_.notify_one();
  }

  // Resumes queued coroutines until `done()` holds
  template <typename Pred>
  void Drain(Pred done) {
    while (!done()) {
      std::coroutine_handle<> next;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty(); });
        next = queue_.front();
        queue_.pop_front();
      }
      next.resume();
    }
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::coroutine_handle<>> queue_;
};

namespace detail {

template <typename T>
struct CallbackState {
  std::optional<Result<T>> result;
  std::coroutine_handle<> continuation;
  std::atomic<bool> ready{false};
};

}  // namespace detail

// Turns "start(op, callback)" into co_await. The callback may run inline
// from the initiator or later from another thread; whichever of the two
// sides comes second resumes the coroutine. With a queue the resumption is
// handed to the queue's thread, without one it happens in the callback.
template <typename T>
class CallbackAwaitable {
 public:
  using Callback = std::function<void(Result<T>)>;
  using Initiator = std::function<void(Callback)>;

  explicit CallbackAwaitable(Initiator initiator, ResumeQueue* queue = nullptr)
      : initiator_(std::move(initiator)),
        queue_(queue),
        state_(std::make_shared<detail::CallbackState<T>>()) {}

  bool await_ready() noexcept { return false; }

  bool await_suspend(std::coroutine_handle<> continuation) {
    state_->continuation = continuation;
    auto state = state_;
    ResumeQueue* queue = queue_;
    initiator_([state, queue](Result<T> result) {
      state->result.emplace(std::move(result));
      if (state->ready.exchange(true, std::memory_order_acq_rel)) {
        if (queue != nullptr) {
          queue->Push(state->continuation);
        } else {
          state->continuation.resume();
        }
      }
    });
    // False: the callback already ran, continue without suspending
    return !state_->ready.exchange(true, std::memory_order_acq_rel);
  }

  Result<T> await_resume() { return std::move(*state_->result); }

 private:
  Initiator initiator_;
  ResumeQueue* queue_;
  std::shared_ptr<detail::CallbackState<T>> state_;
};

}  // namespace guise

#endif  // GUISE_TASK_H_
