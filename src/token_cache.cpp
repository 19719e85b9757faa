#include <skysync/token_cache.hpp>
#include <skysync/opensky.hpp>
#include <spdlog/spdlog.h>

namespace skysync {

std::optional<std::string> TokenCache::get_token() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!token_.empty() && clock_.now() < expiry_) return token_;
  return exchange_();
}

void TokenCache::invalidate() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!token_.empty()) spdlog::info("token: invalidated");
  token_.clear();
  expiry_ = 0.0;
}

double TokenCache::expiry() const {
  std::lock_guard<std::mutex> lk(mu_);
  return expiry_;
}

// Caller holds mu_.
std::optional<std::string> TokenCache::exchange_() {
  token_.clear();
  expiry_ = 0.0;
  if (!has_credentials()) {
    spdlog::debug("token: no client credentials configured");
    return std::nullopt;
  }

  HttpRequest req;
  req.method = HttpRequest::Method::Post;
  req.url = cfg_.auth_url;
  req.headers = {"Content-Type: application/x-www-form-urlencoded"};
  req.body = opensky::token_request_body(cfg_.client_id, cfg_.client_secret);
  req.timeout_s = cfg_.request_timeout_s;

  ++exchanges_;
  const double requested_at = clock_.now();
  const HttpResponse resp = http_.perform(req);
  if (!resp.transport_ok()) {
    spdlog::warn("token: exchange failed: {}",
                 resp.timed_out ? std::string("timeout") : resp.transport_error);
    return std::nullopt;
  }
  if (resp.status != 200) {
    spdlog::warn("token: exchange rejected with HTTP {}", resp.status);
    return std::nullopt;
  }
  auto grant = opensky::parse_token(resp.body);
  if (!grant) {
    spdlog::warn("token: response without access_token");
    return std::nullopt;
  }

  const double expires_in = grant->expires_in_s > 0.0 ? grant->expires_in_s : kDefaultExpiresInS;
  token_ = grant->access_token;
  expiry_ = requested_at + expires_in - cfg_.token_expiry_buffer_s;
  spdlog::info("token: obtained, valid for {:.0f}s", expiry_ - requested_at);
  return token_;
}

} // namespace skysync
