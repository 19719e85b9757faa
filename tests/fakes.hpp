#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include <skysync/clock.hpp>
#include <skysync/http.hpp>

namespace skysync::test {

// Time only moves when told to; sleep_for advances it and is recorded.
// Read `sleeps` only while no other thread uses the clock.
class ManualClock final : public Clock {
public:
  explicit ManualClock(double start = 1'700'000'000.0) : now_(start) {}
  double now() const override {
    std::lock_guard<std::mutex> lk(mu_);
    return now_;
  }
  void sleep_for(double s) override {
    std::lock_guard<std::mutex> lk(mu_);
    sleeps.push_back(s);
    if (s > 0.0) now_ += s;
  }
  void advance(double s) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ += s;
  }

  std::vector<double> sleeps;
private:
  mutable std::mutex mu_;
  double now_;
};

// Answers GETs and POSTs from separate scripted queues, recording every request.
// When a queue is empty the matching fallback handler answers.
class ScriptedHttpClient final : public HttpClient {
public:
  // Handlers run without the lock held, so they may block.
  HttpResponse perform(const HttpRequest& req) override {
    std::function<HttpResponse(const HttpRequest&)> handler;
    {
      std::lock_guard<std::mutex> lk(mu_);
      requests.push_back(req);
      auto& q = (req.method == HttpRequest::Method::Post) ? posts_ : gets_;
      if (!q.empty()) {
        HttpResponse r = q.front();
        q.pop_front();
        return r;
      }
      handler = (req.method == HttpRequest::Method::Post) ? on_post : on_get;
    }
    if (handler) return handler(req);
    HttpResponse r;
    r.status = 500;
    return r;
  }

  void push_get(HttpResponse r)  { std::lock_guard<std::mutex> lk(mu_); gets_.push_back(std::move(r)); }
  void push_post(HttpResponse r) { std::lock_guard<std::mutex> lk(mu_); posts_.push_back(std::move(r)); }

  std::size_t count(HttpRequest::Method m) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (const auto& r : requests) if (r.method == m) ++n;
    return n;
  }
  std::size_t gets() const  { return count(HttpRequest::Method::Get); }
  std::size_t posts() const { return count(HttpRequest::Method::Post); }

  std::function<HttpResponse(const HttpRequest&)> on_get;
  std::function<HttpResponse(const HttpRequest&)> on_post;
  std::vector<HttpRequest> requests;

private:
  mutable std::mutex mu_;
  std::deque<HttpResponse> gets_;
  std::deque<HttpResponse> posts_;
};

inline HttpResponse respond(long status, std::string body = {}) {
  HttpResponse r;
  r.status = status;
  r.body = std::move(body);
  return r;
}

inline HttpResponse timeout_response() {
  HttpResponse r;
  r.timed_out = true;
  return r;
}

inline bool has_header(const HttpRequest& r, const std::string& line) {
  for (const auto& h : r.headers) if (h == line) return true;
  return false;
}

// One upstream state vector, named
struct StateRow {
  std::string icao24;
  std::string callsign = "TEST1   ";
  double lat = 0.0;
  double lon = 0.0;
  std::optional<double> track = 90.0;
  std::optional<double> velocity = 230.0;
  double baro_alt = 10000.0;
  bool on_ground = false;
  double time_position = 0.0;
};

// {"time": t, "states": [[17 fields], ...]}
inline std::string states_body(double time, const std::vector<StateRow>& rows) {
  using nlohmann::json;
  json states = json::array();
  for (const auto& r : rows) {
    states.push_back(json::array({
      r.icao24, r.callsign, "United States", r.time_position, r.time_position,
      r.lon, r.lat, r.baro_alt, r.on_ground,
      r.velocity ? json(*r.velocity) : json(nullptr),
      r.track ? json(*r.track) : json(nullptr),
      0.0, nullptr, r.baro_alt + 50.0, "1200", false, 0
    }));
  }
  return json{{"time", time}, {"states", states}}.dump();
}

inline std::string token_body(const std::string& token, double expires_in) {
  return nlohmann::json{{"access_token", token}, {"expires_in", expires_in}}.dump();
}

} // namespace skysync::test
