#pragma once
#include <string>
#include <utility>
#include <skysync/snapshot.hpp>

namespace skysync {

enum class ErrorCode : int {
  Ok = 0,
  Validation,           // missing / non-finite / inverted bounds
  AreaTooLarge,         // bbox exceeds the configured maximum extent
  Auth,                 // credential exchange or refresh failed
  RateLimited,          // upstream 429, carries retry-after
  UpstreamTransient,    // 5xx / timeout, retried internally
  UpstreamUnavailable,  // retries exhausted and no fallback allowed
  Cancelled,            // superseded by a newer viewport
};

// Outcome of one fetch through the Fetcher or the tile pipeline.
struct FetchResult {
  ErrorCode code = ErrorCode::Ok;
  SnapshotSet data;
  std::string message;
  double retry_after_s = 0.0;     // only meaningful for RateLimited

  bool ok() const { return code == ErrorCode::Ok; }

  static FetchResult success(SnapshotSet s) {
    FetchResult r;
    r.data = std::move(s);
    return r;
  }
  static FetchResult failure(ErrorCode c, std::string msg, double retry_after = 0.0) {
    FetchResult r;
    r.code = c;
    r.message = std::move(msg);
    r.retry_after_s = retry_after;
    return r;
  }
};

inline const char* error_name(ErrorCode c) {
  switch (c) {
    case ErrorCode::Ok:                  return "Ok";
    case ErrorCode::Validation:          return "ValidationError";
    case ErrorCode::AreaTooLarge:        return "AreaTooLargeError";
    case ErrorCode::Auth:                return "AuthError";
    case ErrorCode::RateLimited:         return "RateLimitedError";
    case ErrorCode::UpstreamTransient:   return "UpstreamTransientError";
    case ErrorCode::UpstreamUnavailable: return "UpstreamUnavailableError";
    case ErrorCode::Cancelled:           return "CancelledError";
  }
  return "Unknown";
}

// HTTP-equivalent status surfaced to inbound callers.
inline int http_status_for(ErrorCode c) {
  switch (c) {
    case ErrorCode::Ok:                  return 200;
    case ErrorCode::Validation:          return 400;
    case ErrorCode::AreaTooLarge:        return 413;
    case ErrorCode::RateLimited:         return 429;
    case ErrorCode::Cancelled:           return 499;
    case ErrorCode::Auth:
    case ErrorCode::UpstreamTransient:
    case ErrorCode::UpstreamUnavailable: return 503;
  }
  return 500;
}

} // namespace skysync
