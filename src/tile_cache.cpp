#include <skysync/tile_cache.hpp>
#include <vector>
#include <spdlog/spdlog.h>

namespace skysync {

void merge_dedup(SnapshotSet& into, std::unordered_map<std::string, std::size_t>& index,
                 const SnapshotSet& incoming) {
  for (const auto& r : incoming.aircraft) {
    auto it = index.find(r.id);
    if (it != index.end()) {
      into.aircraft[it->second] = r;
    } else {
      index.emplace(r.id, into.aircraft.size());
      into.aircraft.push_back(r);
    }
  }
}

std::optional<SnapshotSet> TileCache::lookup_(const std::string& key, double now) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tiles_.find(key);
  if (it == tiles_.end()) return std::nullopt;
  if (now - it->second.cached_at >= cfg_.tile_ttl_s) {
    tiles_.erase(it);
    return std::nullopt;
  }
  return it->second.data;
}

void TileCache::store_(const std::string& key, const BBox& b, const SnapshotSet& s, double now) {
  std::lock_guard<std::mutex> lk(mu_);
  tiles_[key] = Tile{b, s, now};
}

void TileCache::wait_for_spacing_() {
  if (!last_request_at_) return;
  const double elapsed = clock_.now() - *last_request_at_;
  if (elapsed < cfg_.tile_spacing_s) clock_.sleep_for(cfg_.tile_spacing_s - elapsed);
}

FetchResult TileCache::fetch_large(const BBox& bbox, const Progress& progress,
                                   const CancelToken* cancel) {
  if (!is_valid(bbox)) {
    return FetchResult::failure(ErrorCode::Validation, "Invalid bounding box");
  }
  const BBox region = clamp_to_world(bbox);
  const std::vector<BBox> parts = split_into_tiles(region, cfg_.tile_max_extent_deg);
  if (parts.size() > 1) {
    spdlog::info("tiles: region split into {} tiles", parts.size());
  }

  SnapshotSet merged;
  std::unordered_map<std::string, std::size_t> index;
  bool any_fallback = false;
  bool all_cached = true;
  std::string fallback_message;
  auto tag = [&] {
    merged.fallback = any_fallback;
    if (any_fallback) {
      merged.source = "synthetic";
      merged.message = fallback_message;
    } else {
      merged.source = all_cached ? "cache" : "opensky";
    }
  };

  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (is_cancelled(cancel)) return FetchResult::failure(ErrorCode::Cancelled, "cancelled");

    const BBox& tile = parts[i];
    const std::string key = canonical_key(tile, cfg_.cache_key_precision_deg);

    if (auto cached = lookup_(key, clock_.now())) {
      ++cache_hits_;
      spdlog::debug("tiles: cache hit {}", key);
      merge_dedup(merged, index, *cached);
    } else {
      all_cached = false;
      wait_for_spacing_();
      if (is_cancelled(cancel)) return FetchResult::failure(ErrorCode::Cancelled, "cancelled");

      last_request_at_ = clock_.now();
      ++network_calls_;
      FetchResult r = fetcher_.fetch_region(tile, cancel);
      if (!r.ok()) {
        if (r.code != ErrorCode::Cancelled) {
          spdlog::warn("tiles: tile {}/{} failed: {}", i + 1, parts.size(), r.message);
        }
        return r;
      }
      if (r.data.fallback) {
        any_fallback = true;
        fallback_message = r.data.message;
      } else {
        store_(key, tile, r.data, clock_.now());
      }
      merge_dedup(merged, index, r.data);
    }

    if (progress) {
      tag();
      progress(i + 1, parts.size(), merged);
    }
  }

  if (is_cancelled(cancel)) return FetchResult::failure(ErrorCode::Cancelled, "cancelled");

  tag();
  return FetchResult::success(std::move(merged));
}

void TileCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  tiles_.clear();
}

std::size_t TileCache::purge_expired() {
  const double now = clock_.now();
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t removed = 0;
  for (auto it = tiles_.begin(); it != tiles_.end();) {
    if (now - it->second.cached_at >= cfg_.tile_ttl_s) {
      it = tiles_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t TileCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tiles_.size();
}

} // namespace skysync
