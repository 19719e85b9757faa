#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <skysync/clock.hpp>
#include <skysync/errors.hpp>
#include <skysync/settings.hpp>
#include <skysync/snapshot.hpp>
#include <skysync/tile_cache.hpp>

namespace skysync {

// Client-side visibility rules: airborne, high enough, fresh enough, fast enough.
bool passes_display_filter(const AircraftReport& r, double now, const Settings& cfg);

struct QueryResult {
  ErrorCode code = ErrorCode::Ok;
  int http_status = 200;
  std::vector<AircraftReport> aircraft;
  bool fallback = false;
  std::string message;
  std::string source;
  double retry_after_s = 0.0;

  bool ok() const { return code == ErrorCode::Ok; }
};

// Inbound bounded query: validation, area cap, tiled fetch, clip and filter.
class QueryService {
public:
  QueryService(TileCache& tiles, Clock& clock, const Settings& cfg)
    : tiles_(tiles), clock_(clock), cfg_(cfg) {}

  // Missing (nullopt), non-finite or inverted bounds -> 400.
  QueryResult get_snapshots(std::optional<double> lat_min, std::optional<double> lon_min,
                            std::optional<double> lat_max, std::optional<double> lon_max,
                            const CancelToken* cancel = nullptr);

private:
  TileCache& tiles_;
  Clock& clock_;
  const Settings& cfg_;
};

// {"flights":[...]} (+ "_fallback", "_message", "_source" when synthetic)
// or {"message": "..."} for errors.
nlohmann::json to_json(const QueryResult& r);

} // namespace skysync
