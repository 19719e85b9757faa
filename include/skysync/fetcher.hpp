#pragma once
#include <skysync/clock.hpp>
#include <skysync/errors.hpp>
#include <skysync/geo.hpp>
#include <skysync/http.hpp>
#include <skysync/settings.hpp>
#include <skysync/token_cache.hpp>

namespace skysync {

// One bounded upstream query with auth refresh, retry/backoff and fallback.
//  - 401: invalidate token, refresh, retry once; second 401 -> Auth
//  - 429: RateLimited with retry-after, never retried here
//  - 5xx / timeout / transport / unparsable body: retried up to max_attempts,
//    sleeping backoff_base_s * 2^(n-1) after the n-th failure
//  - other 4xx: unrecoverable at once
// Exhausted or unrecoverable -> UpstreamUnavailable, or a synthetic set when
// fallback_enabled.
class SnapshotFetcher {
public:
  SnapshotFetcher(HttpClient& http, TokenCache& tokens, Clock& clock, const Settings& cfg)
    : http_(http), tokens_(tokens), clock_(clock), cfg_(cfg) {}

  FetchResult fetch_region(const BBox& bbox, bool auth_optional,
                           const CancelToken* cancel = nullptr);

  FetchResult fetch_region(const BBox& bbox, const CancelToken* cancel = nullptr) {
    return fetch_region(bbox, cfg_.auth_optional, cancel);
  }

  // Delay slept after the n-th failed attempt (n >= 1).
  double backoff_delay(int n) const;

private:
  FetchResult unavailable_(const BBox& b, const std::string& why);

  HttpClient& http_;
  TokenCache& tokens_;
  Clock& clock_;
  const Settings& cfg_;
};

} // namespace skysync
