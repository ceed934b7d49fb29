// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_CORE_REACTOR_H_
#define GUISE_CORE_REACTOR_H_

#include <uv.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace guise {
namespace core {

enum class EventType : uint32_t {
  kNone = 0,
  kRead = UV_READABLE,
  kWrite = UV_WRITABLE,
  kReadWrite = UV_READABLE | UV_WRITABLE,
};

inline EventType operator|(EventType a, EventType b) {
  return static_cast<EventType>(static_cast<uint32_t>(a) |
                                static_cast<uint32_t>(b));
}

inline bool HasEvent(EventType events, EventType check) {
  return (static_cast<uint32_t>(events) & static_cast<uint32_t>(check)) != 0;
}

// Receives readiness events for one file descriptor.
class EventHandler {
 public:
  virtual ~EventHandler() = default;

  virtual int fd() const = 0;
  virtual void OnReadable() = 0;
  virtual void OnWritable() = 0;
  virtual void OnError(int error_code) = 0;
  virtual void OnClose() = 0;
};

using TimerId = uint64_t;

// Single-threaded libuv event loop. Everything except Post() and Stop()
// must be called from the loop thread (or before the loop runs).
class Reactor {
 public:
  Reactor();
  ~Reactor();

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;
  Reactor(Reactor&&) = delete;
  Reactor& operator=(Reactor&&) = delete;

  // Two-phase initialization - must call before use
  bool Initialize();
  bool IsInitialized() const { return loop_ != nullptr; }
  std::string_view last_error() const { return last_error_; }

  bool Add(EventHandler* handler, EventType events);
  bool Modify(EventHandler* handler, EventType events);
  bool Remove(EventHandler* handler);
  bool Contains(int fd) const { return polls_.count(fd) != 0; }

  void Run();
  void RunOnce();
  void RunFor(int timeout_ms);
  void Stop();

  bool running() const { return running_.load(std::memory_order_acquire); }

  // True on the thread currently running the loop
  bool InLoopThread() const;

  // Monotonic milliseconds, cached per iteration
  uint64_t now_ms() const { return now_ms_; }

  // Thread-safe. The callback runs on the loop thread on a later iteration.
  void Post(std::function<void()> callback);

  // Fires after `delay_ms`, then every `repeat_ms` if non-zero
  TimerId AddTimer(uint64_t delay_ms, uint64_t repeat_ms,
                   std::function<void()> callback);

  // Safe to call from the timer's own callback
  bool CancelTimer(TimerId id);

  size_t handler_count() const { return polls_.size(); }
  size_t timer_count() const { return timers_.size(); }

  uv_loop_t* loop() { return loop_; }

 private:
  struct PollData {
    uv_poll_t handle;
    EventHandler* handler;
  };

  struct TimerData {
    uv_timer_t handle;
    Reactor* reactor;
    TimerId id;
    bool repeating;
    std::function<void()> callback;
  };

  void UpdateTime();
  void ProcessPostedCallbacks();
  void CloseTimer(TimerData* timer);

  static void OnPollEvent(uv_poll_t* handle, int status, int events);
  static void OnTimer(uv_timer_t* handle);
  static void OnRunTimer(uv_timer_t* handle);
  static void OnAsync(uv_async_t* handle);
  static void OnPollClosed(uv_handle_t* handle);
  static void OnTimerClosed(uv_handle_t* handle);

  uv_loop_t* loop_ = nullptr;
  uv_async_t async_;
  uv_timer_t run_timer_;
  std::atomic<bool> running_{false};
  // Set by Stop(), consumed by Run(). A Stop() before Run() still counts.
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::thread::id> loop_thread_{};
  uint64_t now_ms_ = 0;

  std::unordered_map<int, PollData*> polls_;
  std::unordered_map<TimerId, TimerData*> timers_;
  TimerId next_timer_id_ = 1;

  // Posted callbacks (thread-safe addition, processed on the loop thread)
  std::mutex posted_mutex_;
  std::vector<std::function<void()>> posted_callbacks_;
  std::vector<std::function<void()>> pending_callbacks_;
  std::atomic<bool> has_posted_{false};

  std::string last_error_;
};

// Cancels its timer on destruction.
class TimerGuard {
 public:
  TimerGuard() = default;
  TimerGuard(Reactor* reactor, TimerId id) : reactor_(reactor), id_(id) {}
  ~TimerGuard() { Cancel(); }

  TimerGuard(TimerGuard&& other) noexcept
      : reactor_(other.reactor_), id_(other.id_) {
    other.reactor_ = nullptr;
    other.id_ = 0;
  }

  TimerGuard& operator=(TimerGuard&& other) noexcept {
    if (this != &other) {
      Cancel();
      reactor_ = other.reactor_;
      id_ = other.id_;
      other.reactor_ = nullptr;
      other.id_ = 0;
    }
    return *this;
  }

  TimerGuard(const TimerGuard&) = delete;
  TimerGuard& operator=(const TimerGuard&) = delete;

  void Cancel() {
    if (reactor_ != nullptr && id_ != 0) {
      reactor_->CancelTimer(id_);
    }
    reactor_ = nullptr;
    id_ = 0;
  }

  bool Valid() const { return reactor_ != nullptr && id_ != 0; }

 private:
  Reactor* reactor_ = nullptr;
  TimerId id_ = 0;
};

}  // namespace core
}  // namespace guise

#endif  // GUISE_CORE_REACTOR_H_
