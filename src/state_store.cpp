#include <skysync/state_store.hpp>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace skysync {

static std::string normalize_query(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

const char* phase_name(Phase p) {
  switch (p) {
    case Phase::New:    return "NEW";
    case Phase::Active: return "ACTIVE";
    case Phase::Stale:  return "STALE";
  }
  return "UNKNOWN";
}

StateStore::IngestStats StateStore::ingest(const SnapshotSet& set, double observed_at) {
  IngestStats st;
  const InterpParams params = InterpParams::from(cfg_);
  const double too_old = observed_at - cfg_.hard_stale_s;

  std::unordered_map<std::string, Entity> next;
  next.reserve(entities_.size() + set.aircraft.size());

  // One report per id; the last one in the set wins.
  std::unordered_map<std::string, const AircraftReport*> latest;
  latest.reserve(set.aircraft.size());
  for (const auto& r : set.aircraft) {
    if (!r.id.empty()) latest[r.id] = &r;
  }

  for (const auto& [id, rp] : latest) {
    const AircraftReport& r = *rp;
    auto it = entities_.find(id);
    const Entity* existing = (it != entities_.end()) ? &it->second : nullptr;

    if (r.snapshot.observed_at < too_old) {
      if (existing) ++st.evicted;
      continue;
    }

    Entity e;
    if (existing && existing->target.observed_at == r.snapshot.observed_at) {
      e = *existing;
      if (e.phase == Phase::Stale) e.phase = Phase::Active;
    } else if (existing) {
      e = *existing;
      // Continue from where the aircraft is drawn right now, not from the old target.
      const Pose pose = interpolate(*existing, observed_at, params);
      Snapshot from = existing->target;
      from.lon = pose.lon;
      from.lat = pose.lat;
      from.altitude_m = pose.altitude_m;
      if (existing->previous.heading_deg || existing->target.heading_deg) from.heading_deg = pose.heading_deg;
      from.observed_at = observed_at;
      e.previous = from;
      e.target = r.snapshot;
      e.interpolation_start = std::max(existing->interpolation_start, observed_at);
      e.phase = Phase::Active;
      ++st.updated;
    } else {
      e.id = id;
      e.previous = r.snapshot;
      e.target = r.snapshot;
      e.interpolation_start = observed_at;
      e.phase = Phase::New;
      ++st.created;
    }
    e.callsign = r.callsign;
    e.origin_country = r.origin_country;
    e.squawk = r.squawk;
    e.last_seen_at = std::max(e.last_seen_at, observed_at);
    next.emplace(id, std::move(e));
  }

  for (const auto& [id, old] : entities_) {
    if (latest.count(id)) continue;
    const double absent = observed_at - old.last_seen_at;
    if (absent > cfg_.hard_stale_s) {
      ++st.evicted;
      continue;
    }
    Entity e = old;
    if (absent > cfg_.soft_stale_s && e.phase != Phase::Stale) {
      e.phase = Phase::Stale;
      ++st.stale;
    }
    next.emplace(id, std::move(e));
  }

  entities_.swap(next);
  spdlog::debug("store: +{} ~{} stale {} evicted {} -> {} tracked",
                st.created, st.updated, st.stale, st.evicted, entities_.size());
  return st;
}

StateStore::IngestStats StateStore::age(double now) {
  IngestStats st;
  for (auto it = entities_.begin(); it != entities_.end();) {
    const double absent = now - it->second.last_seen_at;
    if (absent > cfg_.hard_stale_s) {
      it = entities_.erase(it);
      ++st.evicted;
      continue;
    }
    if (absent > cfg_.soft_stale_s && it->second.phase != Phase::Stale) {
      it->second.phase = Phase::Stale;
      ++st.stale;
    }
    ++it;
  }
  if (st.stale || st.evicted) {
    spdlog::debug("store: aged, stale {} evicted {} -> {} tracked", st.stale, st.evicted, entities_.size());
  }
  return st;
}

const Entity* StateStore::get(const std::string& id) const {
  auto it = entities_.find(id);
  return it == entities_.end() ? nullptr : &it->second;
}

const Entity* StateStore::find(const std::string& query) const {
  const std::string q = normalize_query(query);
  if (q.empty()) return nullptr;
  const Entity* by_callsign = nullptr;
  for (const auto& [id, e] : entities_) {
    if (normalize_query(id) == q) return &e;
    if (!by_callsign && normalize_query(e.callsign) == q) by_callsign = &e;
  }
  return by_callsign;
}

} // namespace skysync
