#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <skysync/clock.hpp>
#include <skysync/errors.hpp>
#include <skysync/fetcher.hpp>
#include <skysync/geo.hpp>
#include <skysync/settings.hpp>

namespace skysync {

struct Tile {
  BBox bbox{};
  SnapshotSet data;
  double cached_at = 0.0;
};

// Splits oversized regions into provider-sized tiles, fetches them one at a
// time with spacing, reuses tiles younger than the TTL and merges the results
// (one record per id, last tile wins).
class TileCache {
public:
  // (tiles_completed, tiles_total, merged so far)
  using Progress = std::function<void(std::size_t, std::size_t, const SnapshotSet&)>;

  TileCache(SnapshotFetcher& fetcher, Clock& clock, const Settings& cfg)
    : fetcher_(fetcher), clock_(clock), cfg_(cfg) {}

  FetchResult fetch_large(const BBox& bbox, const Progress& progress = {},
                          const CancelToken* cancel = nullptr);

  void clear();
  std::size_t purge_expired();

  std::size_t size() const;
  std::size_t network_calls() const { return network_calls_; }
  std::size_t cache_hits() const { return cache_hits_; }

private:
  std::optional<SnapshotSet> lookup_(const std::string& key, double now);
  void store_(const std::string& key, const BBox& b, const SnapshotSet& s, double now);
  void wait_for_spacing_();

  SnapshotFetcher& fetcher_;
  Clock& clock_;
  const Settings& cfg_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, Tile> tiles_;

  std::optional<double> last_request_at_;
  std::size_t network_calls_{0};
  std::size_t cache_hits_{0};
};

// Merge `incoming` into `into`, replacing records whose id is already present.
void merge_dedup(SnapshotSet& into, std::unordered_map<std::string, std::size_t>& index,
                 const SnapshotSet& incoming);

} // namespace skysync
