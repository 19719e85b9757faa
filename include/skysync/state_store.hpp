#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <skysync/interp.hpp>
#include <skysync/settings.hpp>
#include <skysync/snapshot.hpp>

namespace skysync {

enum class Phase : int { New = 0, Active, Stale };

const char* phase_name(Phase p);

struct Entity {
  std::string id;
  std::string callsign;
  std::string origin_country;
  std::string squawk;
  Snapshot previous;              // interpolation origin
  Snapshot target;                // latest report
  double interpolation_start = 0.0;
  double last_seen_at = 0.0;
  Phase phase = Phase::New;
};

inline Pose interpolate(const Entity& e, double now, const InterpParams& p) {
  return interpolate(e.previous, e.target, e.interpolation_start, now, p);
}

// Single owner of all tracked aircraft. Written only by ingest() and age().
class StateStore {
public:
  struct IngestStats {
    std::size_t created = 0;
    std::size_t updated = 0;
    std::size_t stale = 0;
    std::size_t evicted = 0;
  };

  explicit StateStore(const Settings& cfg) : cfg_(cfg) {}

  // Apply one snapshot set received at `observed_at`. The new map is built
  // aside and swapped in at the end.
  // A report carrying the observation an entity already targets refreshes it
  // without restarting its interpolation.
  IngestStats ingest(const SnapshotSet& set, double observed_at);

  // Staleness and eviction by time alone, for stretches with no new set.
  IngestStats age(double now);

  const Entity* get(const std::string& id) const;

  // Lookup by ICAO24 or callsign, case-insensitive, surrounding blanks ignored.
  const Entity* find(const std::string& query) const;

  std::size_t size() const { return entities_.size(); }
  const std::unordered_map<std::string, Entity>& entities() const { return entities_; }
  void clear() { entities_.clear(); }

private:
  const Settings& cfg_;
  std::unordered_map<std::string, Entity> entities_;
};

} // namespace skysync
