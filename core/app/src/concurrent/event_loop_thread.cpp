#include "tickrisk/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace tickrisk {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): pop with timeout, publish on the loop thread
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (!event) {
      continue;
    }

    // A faulty subscriber must not take the whole loop down with it.
    try {
      bus_.publish(*event);
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] ERROR: subscriber threw: " << e.what()
                << "\n";
    }
  }
}

}  // namespace tickrisk
