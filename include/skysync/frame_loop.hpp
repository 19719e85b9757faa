#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <skysync/clock.hpp>

namespace skysync {

// Fixed-cadence render loop. stop() may be called from tick or another thread;
// the flag is checked at the top of every iteration.
class FrameLoop {
public:
  FrameLoop(Clock& clock, double interval_s) : clock_(clock), interval_s_(interval_s) {}

  // Blocks until stop(). Returns the number of frames run.
  std::uint64_t run(const std::function<void(double now)>& tick);

  void stop() { stop_.store(true, std::memory_order_release); }
  bool stopped() const { return stop_.load(std::memory_order_acquire); }

private:
  Clock& clock_;
  double interval_s_;
  std::atomic<bool> stop_{false};
};

} // namespace skysync
