#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <skysync/clock.hpp>
#include <skysync/geo.hpp>
#include <skysync/settings.hpp>
#include <skysync/snap_buffer.hpp>
#include <skysync/tile_cache.hpp>

namespace skysync {

// Owns the network thread. Runs one tile pipeline per viewport generation,
// re-polls the current region every poll_interval_s (longer after a 429)
// and publishes finished results into a latest-only buffer.
class SyncRunner {
public:
  SyncRunner(TileCache& tiles, Clock& clock, const Settings& cfg)
    : tiles_(tiles), clock_(clock), cfg_(cfg) {}
  ~SyncRunner() { stop(); }
  SyncRunner(const SyncRunner&) = delete;
  SyncRunner& operator=(const SyncRunner&) = delete;

  void start();
  void stop();

  // New viewport: bumps the generation and cancels the pipeline in flight.
  // Safe to call from the UI thread.
  void request_viewport(const BBox& region);

  std::uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

  // True if `u` was produced for the latest requested viewport.
  bool is_current(const SyncUpdate& u) const { return u.generation == generation(); }

  SyncBuffer& buffer() { return buffer_; }
  const SyncBuffer& buffer() const { return buffer_; }

  std::size_t pipelines_started() const { return pipelines_started_.load(); }
  bool running() const { return running_.load(); }

private:
  void thread_main_();

  TileCache& tiles_;
  Clock& clock_;
  const Settings& cfg_;

  std::thread th_;
  std::atomic<bool> running_{false};

  SyncBuffer buffer_;

  // Guarded by mu_
  std::mutex mu_;
  std::condition_variable cv_;
  std::optional<BBox> region_;
  bool pending_request_{false};
  CancelTokenPtr cancel_;
  std::chrono::steady_clock::time_point next_poll_{};

  std::atomic<std::uint64_t> generation_{0};
  std::atomic<std::size_t> pipelines_started_{0};
};

} // namespace skysync
