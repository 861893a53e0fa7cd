#pragma once
#include <chrono>
#include <functional>
#include <mutex>

// Decides when the combined progress/checkpoint callback runs. Callers poll
// freely from any thread; at most one of them fires the callback at a time and
// the rest return immediately. After each firing the interval adapts to the
// callback's own cost so checkpointing a large tree stays a small fraction of
// the run.
class OccasionThrottle {
public:
  using Clock = std::chrono::steady_clock;
  using Callback = std::function<void()>;

  struct Options {
    std::chrono::duration<double> initial_interval{10.0};
    std::chrono::duration<double> cheap_threshold{2.0};
    std::chrono::duration<double> cheap_interval{60.0};
    double cost_multiplier = 25.0;
  };

  OccasionThrottle();
  explicit OccasionThrottle(Options options);

  void set_callback(Callback callback);

  // Returns true when this call fired the callback.
  bool poll();

  std::chrono::duration<double> interval() const;
  std::size_t occasions() const;

private:
  void fire_locked();

  Options options_;
  Callback callback_;
  mutable std::mutex mutex_;
  Clock::time_point last_occasion_;
  std::chrono::duration<double> between_occasions_;
  std::size_t occasions_ = 0;
};
