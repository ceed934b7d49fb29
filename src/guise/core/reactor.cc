// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/core/reactor.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace guise {
namespace core {

Reactor::Reactor() = default;

Reactor::~Reactor() {
  if (loop_ == nullptr) {
    return;
  }

  for (auto& [fd, poll_data] : polls_) {
    uv_poll_stop(&poll_data->handle);
    uv_close(reinterpret_cast<uv_handle_t*>(&poll_data->handle), OnPollClosed);
  }
  polls_.clear();

  for (auto& [id, timer] : timers_) {
    uv_timer_stop(&timer->handle);
    uv_close(reinterpret_cast<uv_handle_t*>(&timer->handle), OnTimerClosed);
  }
  timers_.clear();

  uv_timer_stop(&run_timer_);
  uv_close(reinterpret_cast<uv_handle_t*>(&run_timer_), nullptr);
  uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);

  // Let the close callbacks run and outstanding requests drain
  uv_run(loop_, UV_RUN_DEFAULT);

  if (uv_loop_close(loop_) != 0) {
    SPDLOG_WARN("libuv loop closed with active handles");
  }
  delete loop_;
}

bool Reactor::Initialize() {
  if (loop_ != nullptr) {
    return true;
  }

  auto* loop = new uv_loop_t;
  int rv = uv_loop_init(loop);
  if (rv != 0) {
    delete loop;
    last_error_ = std::string("Failed to initialize libuv loop: ") +
                  uv_strerror(rv);
    return false;
  }

  rv = uv_async_init(loop, &async_, OnAsync);
  if (rv != 0) {
    uv_loop_close(loop);
    delete loop;
    last_error_ = std::string("Failed to initialize async handle: ") +
                  uv_strerror(rv);
    return false;
  }
  async_.data = this;

  uv_timer_init(loop, &run_timer_);
  run_timer_.data = this;

  loop_ = loop;
  UpdateTime();
  return true;
}

bool Reactor::Add(EventHandler* handler, EventType events) {
  if (loop_ == nullptr || handler == nullptr || handler->fd() < 0) {
    return false;
  }

  int fd = handler->fd();
  if (polls_.count(fd) != 0) {
    return false;
  }

  auto* poll_data = new PollData;
  poll_data->handler = handler;

  if (uv_poll_init(loop_, &poll_data->handle, fd) != 0) {
    delete poll_data;
    return false;
  }
  poll_data->handle.data = poll_data;

  if (uv_poll_start(&poll_data->handle, static_cast<int>(events),
                    OnPollEvent) != 0) {
    uv_close(reinterpret_cast<uv_handle_t*>(&poll_data->handle), OnPollClosed);
    return false;
  }

  polls_[fd] = poll_data;
  return true;
}

bool Reactor::Modify(EventHandler* handler, EventType events) {
  if (handler == nullptr) {
    return false;
  }
  auto it = polls_.find(handler->fd());
  if (it == polls_.end()) {
    return false;
  }
  return uv_poll_start(&it->second->handle, static_cast<int>(events),
                       OnPollEvent) == 0;
}

bool Reactor::Remove(EventHandler* handler) {
  if (handler == nullptr) {
    return false;
  }
  auto it = polls_.find(handler->fd());
  if (it == polls_.end()) {
    return false;
  }

  PollData* poll_data = it->second;
  polls_.erase(it);

  // Events already dispatched for this iteration must not reach the handler
  poll_data->handler = nullptr;
  uv_poll_stop(&poll_data->handle);
  uv_close(reinterpret_cast<uv_handle_t*>(&poll_data->handle), OnPollClosed);
  return true;
}

void Reactor::Run() {
  running_.store(true, std::memory_order_release);
  loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);

  while (!stop_requested_.exchange(false, std::memory_order_acq_rel)) {
    UpdateTime();
    ProcessPostedCallbacks();
    uv_run(loop_, UV_RUN_ONCE);
  }
  ProcessPostedCallbacks();

  running_.store(false, std::memory_order_release);
  loop_thread_.store(std::thread::id(), std::memory_order_release);
}

void Reactor::RunOnce() {
  loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);
  UpdateTime();
  ProcessPostedCallbacks();
  uv_run(loop_, UV_RUN_NOWAIT);
  UpdateTime();
  ProcessPostedCallbacks();
}

void Reactor::RunFor(int timeout_ms) {
  uv_timer_start(&run_timer_, OnRunTimer, static_cast<uint64_t>(timeout_ms), 0);
  Run();
  uv_timer_stop(&run_timer_);
}

void Reactor::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  // Wake up the loop if it's blocked
  uv_async_send(&async_);
}

bool Reactor::InLoopThread() const {
  return loop_thread_.load(std::memory_order_acquire) ==
         std::this_thread::get_id();
}

void Reactor::Post(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    posted_callbacks_.push_back(std::move(callback));
  }
  has_posted_.store(true, std::memory_order_release);
  uv_async_send(&async_);
}

TimerId Reactor::AddTimer(uint64_t delay_ms, uint64_t repeat_ms,
                          std::function<void()> callback) {
  auto* timer = new TimerData;
  timer->reactor = this;
  timer->id = next_timer_id_++;
  timer->repeating = repeat_ms != 0;
  timer->callback = std::move(callback);

  uv_timer_init(loop_, &timer->handle);
  timer->handle.data = timer;
  uv_timer_start(&timer->handle, OnTimer, delay_ms, repeat_ms);

  timers_[timer->id] = timer;
  return timer->id;
}

bool Reactor::CancelTimer(TimerId id) {
  auto it = timers_.find(id);
  if (it == timers_.end()) {
    return false;
  }
  TimerData* timer = it->second;
  timers_.erase(it);
  CloseTimer(timer);
  return true;
}

void Reactor::CloseTimer(TimerData* timer) {
  uv_timer_stop(&timer->handle);
  uv_close(reinterpret_cast<uv_handle_t*>(&timer->handle), OnTimerClosed);
}

void Reactor::UpdateTime() {
  uv_update_time(loop_);
  now_ms_ = uv_now(loop_);
}

void Reactor::ProcessPostedCallbacks() {
  if (!has_posted_.load(std::memory_order_acquire)) {
    return;
  }

  // Swap under lock, then process without holding lock
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    pending_callbacks_.swap(posted_callbacks_);
    posted_callbacks_.clear();
    has_posted_.store(false, std::memory_order_release);
  }

  for (auto& callback : pending_callbacks_) {
    callback();
  }
  pending_callbacks_.clear();
}

void Reactor::OnPollEvent(uv_poll_t* handle, int status, int events) {
  auto* poll_data = static_cast<PollData*>(handle->data);

  // Each step may remove the handler; recheck before the next one
  if (poll_data->handler == nullptr) return;
  if (status < 0) {
    poll_data->handler->OnError(-status);
    return;
  }

  if ((events & UV_READABLE) != 0) {
    poll_data->handler->OnReadable();
  }
  if (poll_data->handler == nullptr) return;

  if ((events & UV_WRITABLE) != 0) {
    poll_data->handler->OnWritable();
  }
  if (poll_data->handler == nullptr) return;

  if ((events & UV_DISCONNECT) != 0) {
    poll_data->handler->OnClose();
  }
}

void Reactor::OnTimer(uv_timer_t* handle) {
  auto* timer = static_cast<TimerData*>(handle->data);
  Reactor* reactor = timer->reactor;
  reactor->UpdateTime();

  if (timer->repeating) {
    timer->callback();
    return;
  }

  // One-shot: unregister first so the callback may add or cancel timers
  reactor->timers_.erase(timer->id);
  auto callback = std::move(timer->callback);
  reactor->CloseTimer(timer);
  callback();
}

void Reactor::OnRunTimer(uv_timer_t* handle) {
  static_cast<Reactor*>(handle->data)->Stop();
}

void Reactor::OnAsync(uv_async_t* handle) {
  static_cast<Reactor*>(handle->data)->ProcessPostedCallbacks();
}

void Reactor::OnPollClosed(uv_handle_t* handle) {
  delete static_cast<PollData*>(handle->data);
}

void Reactor::OnTimerClosed(uv_handle_t* handle) {
  delete static_cast<TimerData*>(handle->data);
}

}  // namespace core
}  // namespace guise
