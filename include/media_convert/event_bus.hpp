/**
 * @file event_bus.hpp
 * @brief Non-blocking publish/subscribe of job events
 *
 * @details Decouples job workers from whoever displays their progress:
 *
 *          - Workers call publish(), which never waits for a consumer
 *
 *          - Each subscriber owns a bounded EventChannel
 *
 *          - Push subscribers get a delivery thread that calls their handler
 *            in order; pull subscribers pop from the channel themselves
 *
 * @attention ORDERING:
 *
 *   - Events of one job carry sequence numbers 1, 2, 3, ... in publish order
 *
 *   - Every subscriber sees the events of a job in sequence order; gaps mean
 *     dropped Progress events, never dropped Started or terminal events
 */

#ifndef MEDIA_CONVERT_EVENT_BUS_HPP
#define MEDIA_CONVERT_EVENT_BUS_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "types.hpp"

namespace media_convert {

using SubscriptionId = std::uint64_t;
using EventHandler = std::function<void(const JobEvent &)>;

/**
 * @class EventChannel
 * @brief Bounded, thread-safe event queue of one subscriber.
 *
 * @attention OVERFLOW:
 *
 *   - push() never blocks. When the channel holds capacity events, the
 *     oldest Progress event is discarded (or the incoming one, if it is
 *     Progress and nothing older can go)
 *
 *   - Started and terminal events are always kept, even past capacity
 */
class EventChannel {
public:
  EventChannel(SubscriptionId id, std::size_t capacity);

  /// Disable copy
  EventChannel(const EventChannel &) = delete;
  EventChannel &operator=(const EventChannel &) = delete;

  /**
   * @brief Queue an event.
   * @return false if the channel is finished or the event was discarded
   */
  bool push(const JobEvent &event);

  /**
   * @brief Pop an event (blocking).
   * @return true if an event was retrieved, false once finished and empty
   */
  bool pop(JobEvent &event);

  /// pop() with a timeout; false on timeout or when finished and empty
  bool pop_for(JobEvent &event, std::chrono::milliseconds timeout);

  /// Non-blocking pop
  bool try_pop(JobEvent &event);

  /// Signal that no more events will arrive; queued events stay poppable
  void finish();

  bool is_done() const;
  std::size_t size() const;
  std::size_t dropped_count() const;

  SubscriptionId id() const { return id_; }
  std::size_t capacity() const { return capacity_; }

private:
  const SubscriptionId id_;
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<JobEvent> events_;
  std::size_t dropped_ = 0;
  bool done_ = false;
};

/**
 * @class EventBus
 * @brief Fans job events out to every subscriber.
 * @note Explicitly owned; pass it by reference to the JobQueue.
 */
class EventBus {
public:
  /// @param capacity Per-subscriber channel bound
  explicit EventBus(std::size_t capacity = 1024);
  ~EventBus();

  /// Disable copy
  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  /**
   * @brief Stamp the next sequence number of event.job_id and deliver.
   * @return The event as delivered (with its sequence)
   * @note Non-blocking. After shutdown() events are stamped but dropped.
   */
  JobEvent publish(JobEvent event);

  /**
   * @brief Register a push subscriber.
   * @param handler Called on a dedicated thread, one event at a time
   * @return Id for unsubscribe()
   */
  SubscriptionId subscribe(EventHandler handler);

  /// Register a pull subscriber; unsubscribe(channel->id()) to detach
  std::shared_ptr<EventChannel> open_channel();

  /**
   * @brief Detach a subscriber.
   * @note For push subscribers, events already queued are still delivered
   *       before this returns.
   * @return false if id is unknown
   */
  bool unsubscribe(SubscriptionId id);

  /// Finish every channel and join every delivery thread
  void shutdown();

  /// Drop the sequence counter of a job that will publish nothing more
  void forget(JobId job_id);

  std::size_t subscriber_count() const;

private:
  struct Subscription {
    std::shared_ptr<EventChannel> channel;
    std::thread delivery; //< Not joinable for pull subscribers
  };

  static void deliver(const std::shared_ptr<EventChannel> &channel,
                      const EventHandler &handler);
  static void stop(Subscription &subscription);

  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  std::unordered_map<JobId, std::uint64_t> sequences_;
  SubscriptionId next_id_ = 1;
  bool shut_down_ = false;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_EVENT_BUS_HPP
