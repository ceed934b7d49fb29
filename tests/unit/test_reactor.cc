// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/core/reactor.h"

#include <unistd.h>

#include <atomic>
#include <cassert>
#include <print>
#include <thread>

using guise::core::EventHandler;
using guise::core::EventType;
using guise::core::Reactor;
using guise::core::TimerGuard;
using guise::core::TimerId;

namespace {

// Read end of a pipe; stops the reactor on the first byte
class PipeReader : public EventHandler {
 public:
  PipeReader(Reactor* reactor, int fd) : reactor_(reactor), fd_(fd) {}

  int fd() const override { return fd_; }
  void OnReadable() override {
    char c = 0;
    if (read(fd_, &c, 1) == 1) {
      last = c;
      ++reads;
    }
    reactor_->Remove(this);
    reactor_->Stop();
  }
  void OnWritable() override {}
  void OnError(int) override { ++errors; }
  void OnClose() override {}

  char last = 0;
  int reads = 0;
  int errors = 0;

 private:
  Reactor* reactor_;
  int fd_;
};

}  // namespace

void TestReactorCreation() {
  std::print("Testing reactor creation... ");

  Reactor reactor;
  assert(!reactor.IsInitialized());
  assert(reactor.Initialize());
  assert(reactor.IsInitialized());
  assert(reactor.Initialize());  // idempotent

  assert(!reactor.running());
  assert(reactor.handler_count() == 0);
  assert(reactor.timer_count() == 0);

  std::println("PASSED");
}

void TestReactorTime() {
  std::print("Testing reactor time... ");

  Reactor reactor;
  assert(reactor.Initialize());

  uint64_t t1 = reactor.now_ms();
  reactor.RunFor(10);
  uint64_t t2 = reactor.now_ms();
  assert(t2 >= t1);
  assert(!reactor.running());

  std::println("PASSED");
}

void TestOneShotTimer() {
  std::print("Testing one-shot timer... ");

  Reactor reactor;
  assert(reactor.Initialize());

  int fired = 0;
  reactor.AddTimer(5, 0, [&] {
    ++fired;
    reactor.Stop();
  });
  assert(reactor.timer_count() == 1);
  reactor.Run();
  assert(fired == 1);
  assert(reactor.timer_count() == 0);

  std::println("PASSED");
}

void TestRepeatingTimerCancelsItself() {
  std::print("Testing repeating timer... ");

  Reactor reactor;
  assert(reactor.Initialize());

  int ticks = 0;
  TimerId id = 0;
  id = reactor.AddTimer(1, 1, [&] {
    if (++ticks == 3) {
      assert(reactor.CancelTimer(id));
      reactor.Stop();
    }
  });
  reactor.Run();
  assert(ticks == 3);
  assert(!reactor.CancelTimer(id));

  std::println("PASSED");
}

void TestCancelledTimerNeverFires() {
  std::print("Testing timer cancellation... ");

  Reactor reactor;
  assert(reactor.Initialize());

  bool fired = false;
  TimerId id = reactor.AddTimer(1, 0, [&] { fired = true; });
  assert(reactor.CancelTimer(id));
  {
    TimerGuard guard(&reactor, reactor.AddTimer(1, 0, [&] { fired = true; }));
    assert(guard.Valid());
  }
  assert(reactor.timer_count() == 0);
  reactor.RunFor(20);
  assert(!fired);

  std::println("PASSED");
}

void TestPostFromAnotherThread() {
  std::print("Testing cross-thread Post... ");

  Reactor reactor;
  assert(reactor.Initialize());

  std::atomic<bool> ran_in_loop{false};
  std::thread poster([&] {
    reactor.Post([&] {
      ran_in_loop = reactor.InLoopThread();
      reactor.Stop();
    });
  });
  reactor.Run();
  poster.join();
  assert(ran_in_loop);
  assert(!reactor.InLoopThread());

  std::println("PASSED");
}

void TestStopBeforeRun() {
  std::print("Testing Stop before Run... ");

  Reactor reactor;
  assert(reactor.Initialize());

  bool posted = false;
  reactor.Post([&] { posted = true; });
  reactor.Stop();
  reactor.Run();  // returns at once, after draining posted work
  assert(posted);

  std::println("PASSED");
}

void TestReadableHandler() {
  std::print("Testing readable handler... ");

  Reactor reactor;
  assert(reactor.Initialize());

  int fds[2];
  assert(pipe(fds) == 0);
  PipeReader reader(&reactor, fds[0]);
  assert(reactor.Add(&reader, EventType::kRead));
  assert(reactor.Contains(fds[0]));
  assert(!reactor.Add(&reader, EventType::kRead));  // already registered
  assert(reactor.Modify(&reader, EventType::kRead));

  assert(write(fds[1], "x", 1) == 1);
  reactor.Run();

  assert(reader.reads == 1);
  assert(reader.last == 'x');
  assert(!reactor.Contains(fds[0]));
  assert(!reactor.Remove(&reader));

  close(fds[0]);
  close(fds[1]);

  std::println("PASSED");
}

int main() {
  std::println("=== Reactor Unit Tests ===");

  TestReactorCreation();
  TestReactorTime();
  TestOneShotTimer();
  TestRepeatingTimerCancelsItself();
  TestCancelledTimerNeverFires();
  TestPostFromAnotherThread();
  TestStopBeforeRun();
  TestReadableHandler();

  std::println("\nAll reactor tests passed!");
  return 0;
}
