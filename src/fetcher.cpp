#include <skysync/fetcher.hpp>
#include <cmath>
#include <optional>
#include <skysync/fallback.hpp>
#include <skysync/opensky.hpp>
#include <spdlog/spdlog.h>

namespace skysync {

namespace {

HttpRequest states_request(const Settings& cfg, const BBox& b, const std::optional<std::string>& token) {
  HttpRequest req;
  req.method = HttpRequest::Method::Get;
  req.url = opensky::states_url(cfg.api_base_url, b);
  req.timeout_s = cfg.request_timeout_s;
  if (token) req.headers.push_back("Authorization: Bearer " + *token);
  return req;
}

} // namespace

double SnapshotFetcher::backoff_delay(int n) const {
  if (n < 1) return 0.0;
  return cfg_.backoff_base_s * std::pow(2.0, n - 1);
}

FetchResult SnapshotFetcher::unavailable_(const BBox& b, const std::string& why) {
  if (!cfg_.fallback_enabled) {
    spdlog::error("fetch: upstream unavailable: {}", why);
    return FetchResult::failure(ErrorCode::UpstreamUnavailable, "Upstream unavailable: " + why);
  }
  spdlog::warn("fetch: upstream unavailable ({}), serving synthetic traffic", why);
  return FetchResult::success(synthesize_fallback(b, cfg_.fallback_count, clock_.now()));
}

FetchResult SnapshotFetcher::fetch_region(const BBox& bbox, bool auth_optional,
                                          const CancelToken* cancel) {
  if (!is_valid(bbox)) {
    return FetchResult::failure(ErrorCode::Validation, "Invalid bounding box");
  }
  const BBox b = clamp_to_world(bbox);

  if (is_cancelled(cancel)) return FetchResult::failure(ErrorCode::Cancelled, "cancelled");

  std::optional<std::string> token = tokens_.get_token();
  if (!token && !auth_optional) {
    return FetchResult::failure(ErrorCode::Auth, "No bearer token available");
  }

  const int max_attempts = cfg_.max_attempts < 1 ? 1 : cfg_.max_attempts;
  bool auth_retried = false;
  int failures = 0;
  std::string last_error = "no attempt made";

  while (failures < max_attempts) {
    if (is_cancelled(cancel)) return FetchResult::failure(ErrorCode::Cancelled, "cancelled");

    const HttpResponse resp = http_.perform(states_request(cfg_, b, token));

    if (!resp.transport_ok()) {
      last_error = resp.timed_out ? "request timed out" : resp.transport_error;
    } else if (resp.status == 200) {
      std::string err;
      if (auto set = opensky::parse_states(resp.body, &err)) {
        spdlog::debug("fetch: {} aircraft in [{}]", set->aircraft.size(), canonical_key(b, 0.0001));
        return FetchResult::success(std::move(*set));
      }
      last_error = "unparsable response: " + err;
    } else if (resp.status == 401) {
      if (auth_retried) {
        spdlog::error("fetch: provider rejected refreshed token");
        return FetchResult::failure(ErrorCode::Auth, "Authentication failed");
      }
      auth_retried = true;
      spdlog::info("fetch: 401, refreshing token");
      tokens_.invalidate();
      token = tokens_.get_token();
      if (!token) return FetchResult::failure(ErrorCode::Auth, "Token refresh failed");
      continue;   // the refresh retry does not spend the transient budget
    } else if (resp.status == 429) {
      const double wait = opensky::retry_after_hint(resp).value_or(cfg_.poll_interval_s);
      spdlog::warn("fetch: rate limited, retry after {:.0f}s", wait);
      return FetchResult::failure(ErrorCode::RateLimited, "Rate limit exceeded", wait);
    } else if (resp.status >= 500) {
      last_error = "HTTP " + std::to_string(resp.status);
    } else {
      return unavailable_(b, "HTTP " + std::to_string(resp.status));
    }

    ++failures;
    if (failures < max_attempts) {
      const double delay = backoff_delay(failures);
      spdlog::warn("fetch: attempt {}/{} failed ({}), retrying in {:.1f}s",
                   failures, max_attempts, last_error, delay);
      clock_.sleep_for(delay);
    }
  }
  return unavailable_(b, last_error);
}

} // namespace skysync
