/**
 * @file event_bus.cpp
 * @brief Event bus implementation
 */

#include "media_convert/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include "media_convert/logging.hpp"

namespace media_convert {

// **---- EventChannel ----**

EventChannel::EventChannel(SubscriptionId id, std::size_t capacity)
    : id_(id), capacity_(std::max<std::size_t>(capacity, 1)) {}

bool EventChannel::push(const JobEvent &event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_)
      return false;

    if (events_.size() >= capacity_) {
      auto oldest = std::find_if(
          events_.begin(), events_.end(),
          [](const JobEvent &e) { return e.kind == EventKind::Progress; });
      if (oldest != events_.end()) {
        events_.erase(oldest);
        ++dropped_;
      } else if (event.kind == EventKind::Progress) {
        ++dropped_;
        return false;
      }
    }
    events_.push_back(event);
  }
  cv_.notify_one();
  return true;
}

bool EventChannel::pop(JobEvent &event) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !events_.empty() || done_; });

  if (events_.empty())
    return false;

  event = std::move(events_.front());
  events_.pop_front();
  return true;
}

bool EventChannel::pop_for(JobEvent &event,
                           std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout,
                    [this] { return !events_.empty() || done_; }))
    return false;

  if (events_.empty())
    return false;

  event = std::move(events_.front());
  events_.pop_front();
  return true;
}

bool EventChannel::try_pop(JobEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty())
    return false;
  event = std::move(events_.front());
  events_.pop_front();
  return true;
}

void EventChannel::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
  }
  cv_.notify_all();
}

bool EventChannel::is_done() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return done_ && events_.empty();
}

std::size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

std::size_t EventChannel::dropped_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

// **---- EventBus ----**

EventBus::EventBus(std::size_t capacity) : capacity_(capacity) {}

EventBus::~EventBus() { shutdown(); }

JobEvent EventBus::publish(JobEvent event) {
  /// Held across the pushes so concurrent publishers of one job cannot
  /// interleave out of sequence; push() itself never blocks
  std::lock_guard<std::mutex> lock(mutex_);
  event.sequence = ++sequences_[event.job_id];
  if (shut_down_)
    return event;

  for (auto &entry : subscriptions_)
    entry.second.channel->push(event);
  return event;
}

void EventBus::forget(JobId job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sequences_.erase(job_id);
}

SubscriptionId EventBus::subscribe(EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = next_id_++;
  auto channel = std::make_shared<EventChannel>(id, capacity_);
  if (shut_down_) {
    channel->finish();
    return id;
  }

  Subscription &sub = subscriptions_[id];
  sub.channel = channel;
  sub.delivery = std::thread(&EventBus::deliver, channel, std::move(handler));
  return id;
}

std::shared_ptr<EventChannel> EventBus::open_channel() {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = next_id_++;
  auto channel = std::make_shared<EventChannel>(id, capacity_);
  if (shut_down_) {
    channel->finish();
    return channel;
  }
  subscriptions_[id].channel = channel;
  return channel;
}

bool EventBus::unsubscribe(SubscriptionId id) {
  Subscription sub;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end())
      return false;
    sub = std::move(it->second);
    subscriptions_.erase(it);
  }
  stop(sub);
  return true;
}

void EventBus::shutdown() {
  std::map<SubscriptionId, Subscription> subs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    subs.swap(subscriptions_);
  }
  for (auto &entry : subs)
    stop(entry.second);
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

void EventBus::deliver(const std::shared_ptr<EventChannel> &channel,
                       const EventHandler &handler) {
  JobEvent event;
  while (channel->pop(event)) {
    try {
      handler(event);
    } catch (const std::exception &e) {
      LOG_ERROR("Event handler of subscription {} threw: {}", channel->id(),
                e.what());
    }
  }
}

void EventBus::stop(Subscription &subscription) {
  subscription.channel->finish();
  if (!subscription.delivery.joinable())
    return;

  /// A handler unsubscribing itself cannot join its own thread
  if (subscription.delivery.get_id() == std::this_thread::get_id())
    subscription.delivery.detach();
  else
    subscription.delivery.join();
}

} // namespace media_convert
