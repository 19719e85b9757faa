#pragma once
#include <optional>
#include <string>
#include <skysync/geo.hpp>
#include <skysync/http.hpp>
#include <skysync/snapshot.hpp>

namespace skysync::opensky {

// Position of each field inside one "states" entry
enum StateField : int {
  kIcao24 = 0,
  kCallsign = 1,
  kOriginCountry = 2,
  kTimePosition = 3,
  kLastContact = 4,
  kLongitude = 5,
  kLatitude = 6,
  kBaroAltitude = 7,
  kOnGround = 8,
  kVelocity = 9,
  kTrueTrack = 10,
  kVerticalRate = 11,
  kSensors = 12,
  kGeoAltitude = 13,
  kSquawk = 14,
  kMinFields = 12,    // shortest entry we accept
};

// {base}/states/all?lamin=..&lomin=..&lamax=..&lomax=..
std::string states_url(const std::string& api_base_url, const BBox& b);

// grant_type=client_credentials&client_id=..&client_secret=..
std::string token_request_body(const std::string& client_id, const std::string& client_secret);

// Parse a states/all response. Entries without id or position are dropped.
// Returns nullopt (and fills `error`) if the document is malformed.
std::optional<SnapshotSet> parse_states(const std::string& body, std::string* error = nullptr);

struct TokenGrant {
  std::string access_token;
  double expires_in_s = 0.0;   // 0 if the provider did not say
};

std::optional<TokenGrant> parse_token(const std::string& body);

// Seconds to wait from a 429 response, if the provider said so.
std::optional<double> retry_after_hint(const HttpResponse& resp);

std::string url_encode(const std::string& s);

} // namespace skysync::opensky
