#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace skysync {

// Time source and delay primitive. Every scheduled wait in the fetch
// pipeline (throttle, tile spacing, backoff) goes through here.
class Clock {
public:
  virtual ~Clock() = default;
  virtual double now() const = 0;               // unix seconds
  virtual void sleep_for(double seconds) = 0;
};

class SystemClock final : public Clock {
public:
  double now() const override {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
  }
  void sleep_for(double seconds) override {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
  }
};

// Cooperative cancellation shared between a pipeline and whoever supersedes it.
class CancelToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
private:
  std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

inline bool is_cancelled(const CancelToken* t) { return t && t->cancelled(); }

} // namespace skysync
