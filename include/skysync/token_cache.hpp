#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <skysync/clock.hpp>
#include <skysync/http.hpp>
#include <skysync/settings.hpp>

namespace skysync {

// OAuth2 client-credentials bearer token, cached until shortly before expiry.
class TokenCache {
public:
  static constexpr double kDefaultExpiresInS = 1800.0;

  TokenCache(HttpClient& http, Clock& clock, const Settings& cfg)
    : http_(http), clock_(clock), cfg_(cfg) {}

  // Cached token while now < expiry, otherwise a fresh exchange.
  // nullopt when no credentials are configured or the exchange failed.
  std::optional<std::string> get_token();

  // Drop the cached token (the provider answered 401).
  void invalidate();

  bool has_credentials() const { return !cfg_.client_id.empty() && !cfg_.client_secret.empty(); }
  double expiry() const;
  int exchanges() const { return exchanges_; }

private:
  std::optional<std::string> exchange_();

  HttpClient& http_;
  Clock& clock_;
  const Settings& cfg_;

  mutable std::mutex mu_;
  std::string token_;
  double expiry_{0.0};
  int exchanges_{0};
};

} // namespace skysync
