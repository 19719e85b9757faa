#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <skysync/errors.hpp>
#include <skysync/geo.hpp>

namespace skysync {

// Single-producer single-consumer latest-only buffer.
// Readers only ever see the most recent value; older ones are overwritten.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lk(mu_);
    data_ = v;
    seq_.fetch_add(1, std::memory_order_release);
  }

  // Try to consume if sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s == cursor) return false;
    std::lock_guard<std::mutex> lk(mu_);
    out = data_;
    cursor = seq_.load(std::memory_order_acquire);
    return true;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mu_;
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

// One finished fetch pipeline, tagged with the viewport generation it served.
struct SyncUpdate {
  std::uint64_t generation = 0;
  BBox region{};
  FetchResult result;
  double fetched_at = 0.0;
  bool partial = false;   // tiles still outstanding for this generation
};

using SyncBuffer = LatestBuffer<SyncUpdate>;

} // namespace skysync
