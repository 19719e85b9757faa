#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace skysync {

struct HttpRequest {
  enum class Method { Get, Post };
  Method method = Method::Get;
  std::string url;
  std::vector<std::string> headers;   // "Name: value"
  std::string body;                   // POST only
  double timeout_s = 10.0;
};

struct HttpResponse {
  long status = 0;                    // 0 when no HTTP response was received
  std::string body;
  std::map<std::string, std::string> headers; // lower-case names
  bool timed_out = false;
  std::string transport_error;        // non-empty on connection-level failure

  bool transport_ok() const { return !timed_out && transport_error.empty(); }

  std::string header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
  }
};

// Blocking transport. Called from the sync thread only.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse perform(const HttpRequest& req) = 0;
};

// libcurl easy-handle implementation.
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;
  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse perform(const HttpRequest& req) override;

private:
  void* curl_{nullptr};   // CURL*
};

// curl_global_init / curl_global_cleanup for the process lifetime
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
  bool ok() const { return ok_; }
private:
  bool ok_{false};
};

} // namespace skysync
