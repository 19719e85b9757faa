#include <skysync/frame_loop.hpp>

namespace skysync {

std::uint64_t FrameLoop::run(const std::function<void(double now)>& tick) {
  std::uint64_t frames = 0;
  while (!stop_.load(std::memory_order_acquire)) {
    const double t0 = clock_.now();
    tick(t0);
    ++frames;
    if (stop_.load(std::memory_order_acquire)) break;
    const double spent = clock_.now() - t0;
    if (spent < interval_s_) clock_.sleep_for(interval_s_ - spent);
  }
  return frames;
}

} // namespace skysync
