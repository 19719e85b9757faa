#include <skysync/sync_runner.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace skysync {

static std::chrono::steady_clock::duration seconds_(double s) {
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
    std::chrono::duration<double>(s < 0.0 ? 0.0 : s));
}

void SyncRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&SyncRunner::thread_main_, this);
}

void SyncRunner::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_.load()) return;
    running_.store(false);
    if (cancel_) cancel_->cancel();
  }
  cv_.notify_all();
  if (th_.joinable()) th_.join();
}

void SyncRunner::request_viewport(const BBox& region) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (cancel_) cancel_->cancel();
    region_ = region;
    pending_request_ = true;
    generation_.fetch_add(1, std::memory_order_acq_rel);
  }
  cv_.notify_all();
}

void SyncRunner::thread_main_() {
  std::unique_lock<std::mutex> lk(mu_);

  while (running_.load(std::memory_order_relaxed)) {
    if (!pending_request_) {
      auto wake = [this]{ return !running_.load() || pending_request_; };
      if (region_) cv_.wait_until(lk, next_poll_, wake);
      else         cv_.wait(lk, wake);
      if (!running_.load()) break;
      if (!pending_request_ && !region_) continue;
      if (!pending_request_ && std::chrono::steady_clock::now() < next_poll_) continue;
    }

    // Start a pipeline for the current generation
    pending_request_ = false;
    const BBox region = *region_;
    const std::uint64_t gen = generation_.load(std::memory_order_acquire);
    cancel_ = std::make_shared<CancelToken>();
    const CancelTokenPtr token = cancel_;
    lk.unlock();

    ++pipelines_started_;
    spdlog::debug("sync: generation {} started", gen);
    // Publish the merged set after every tile but the last so a wide view fills in
    // while the rest of the grid is still being fetched.
    auto partial = [&](std::size_t done, std::size_t total, const SnapshotSet& merged) {
      if (done >= total || token->cancelled() || gen != generation_.load(std::memory_order_acquire)) return;
      buffer_.publish(SyncUpdate{ .generation = gen, .region = region,
                                  .result = FetchResult::success(merged),
                                  .fetched_at = clock_.now(), .partial = true });
    };
    FetchResult r = tiles_.fetch_large(region, partial, token.get());

    lk.lock();
    if (r.code == ErrorCode::Cancelled || gen != generation_.load(std::memory_order_acquire)) {
      spdlog::debug("sync: generation {} superseded, result dropped", gen);
      continue;
    }

    double delay = cfg_.poll_interval_s;
    if (r.code == ErrorCode::RateLimited) {
      delay = std::max(delay, r.retry_after_s);
      spdlog::warn("sync: rate limited, next poll in {:.0f}s", delay);
    } else if (!r.ok()) {
      spdlog::warn("sync: {}: {}", error_name(r.code), r.message);
    }
    buffer_.publish(SyncUpdate{ .generation = gen, .region = region,
                                .result = std::move(r), .fetched_at = clock_.now() });
    next_poll_ = std::chrono::steady_clock::now() + seconds_(delay);
  }
}

} // namespace skysync
