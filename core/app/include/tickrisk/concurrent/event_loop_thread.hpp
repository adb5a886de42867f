#pragma once

#include "tickrisk/concurrent/thread_safe_queue.hpp"
#include "tickrisk/eventbus/event_bus.hpp"
#include "tickrisk/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace tickrisk {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. This is the consumer side of
// the ingestion channel: the stream client pushes PriceTickEvents from its
// socket thread, and every subscriber (cache write, trigger check) runs
// serialized on this loop's thread.
//
// Thread model: push() is callable from any thread. start()/stop() from the
// owning thread. Subscribers run only on the loop thread. stop() drains
// nothing; events still queued at stop are discarded with the queue.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Joins the worker.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  std::size_t pending() const { return queue_.size(); }
  bool running() const { return running_.load(); }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace tickrisk
