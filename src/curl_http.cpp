#include <skysync/http.hpp>
#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace skysync {

namespace {

constexpr const char* kUserAgent = "skysync/0.1";

size_t receive_body(const char* ptr, size_t size, size_t nmemb, void* userdata) {
  const size_t len = size * nmemb;
  static_cast<std::string*>(userdata)->append(ptr, len);
  return len;
}

// "Name: value\r\n" -> headers["name"] = "value"
size_t receive_header(char* buffer, size_t size, size_t nitems, void* userdata) {
  const size_t len = size * nitems;
  std::string line(buffer, len);
  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    auto not_space = [](unsigned char c){ return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    (*static_cast<std::map<std::string, std::string>*>(userdata))[name] = value;
  }
  // always report everything processed, otherwise curl aborts the transfer
  return len;
}

} // namespace

CurlGlobal::CurlGlobal() {
  const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
  ok_ = (rc == CURLE_OK);
  if (!ok_) spdlog::critical("curl_global_init failed: {}", curl_easy_strerror(rc));
}

CurlGlobal::~CurlGlobal() {
  if (ok_) curl_global_cleanup();
}

CurlHttpClient::CurlHttpClient() : curl_(curl_easy_init()) {
  if (!curl_) spdlog::critical("curl_easy_init failed");
}

CurlHttpClient::~CurlHttpClient() {
  if (curl_) curl_easy_cleanup(static_cast<CURL*>(curl_));
}

HttpResponse CurlHttpClient::perform(const HttpRequest& req) {
  HttpResponse resp;
  if (!curl_) {
    resp.transport_error = "curl handle unavailable";
    return resp;
  }
  CURL* c = static_cast<CURL*>(curl_);
  curl_easy_reset(c);

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_slist* hdrs = nullptr;
  for (const auto& h : req.headers) hdrs = curl_slist_append(hdrs, h.c_str());

  curl_easy_setopt(c, CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout_s * 1000.0));
  curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(c, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, receive_body);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, receive_header);
  curl_easy_setopt(c, CURLOPT_HEADERDATA, &resp.headers);
  if (hdrs) curl_easy_setopt(c, CURLOPT_HTTPHEADER, hdrs);

  if (req.method == HttpRequest::Method::Post) {
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
  } else {
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
  }

  const CURLcode cc = curl_easy_perform(c);
  if (cc != CURLE_OK) {
    if (cc == CURLE_OPERATION_TIMEDOUT) {
      resp.timed_out = true;
      spdlog::warn("HTTP timeout after {:.1f}s: {}", req.timeout_s, req.url);
    } else {
      resp.transport_error = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(cc);
      spdlog::warn("HTTP transport error ({}): {}", static_cast<int>(cc), resp.transport_error);
    }
  } else {
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status);
    if (resp.status != 200) spdlog::debug("HTTP {} for {}", resp.status, req.url);
  }

  curl_slist_free_all(hdrs);
  return resp;
}

} // namespace skysync
