#include "occasion_throttle.hpp"

OccasionThrottle::OccasionThrottle()
  : OccasionThrottle(Options{}) {}

OccasionThrottle::OccasionThrottle(Options options)
  : options_(options),
    last_occasion_(Clock::now()),
    between_occasions_(options.initial_interval) {}

void OccasionThrottle::set_callback(Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
}

bool OccasionThrottle::poll() {
  std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
  if(!lock.owns_lock()) return false;
  if(Clock::now() - last_occasion_ < between_occasions_) return false;
  fire_locked();
  return true;
}

void OccasionThrottle::fire_locked() {
  last_occasion_ = Clock::now();
  if(callback_) callback_();
  std::chrono::duration<double> cost = Clock::now() - last_occasion_;
  if(cost < options_.cheap_threshold) {
    between_occasions_ = options_.cheap_interval;
  } else {
    between_occasions_ = cost * options_.cost_multiplier;
  }
  ++occasions_;
}

std::chrono::duration<double> OccasionThrottle::interval() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return between_occasions_;
}

std::size_t OccasionThrottle::occasions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return occasions_;
}
