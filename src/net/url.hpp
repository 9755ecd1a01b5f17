#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ssokit::net {

// Ordered key/value list; query strings are emitted in insertion order
using QueryParameters = std::vector<std::pair<std::string, std::string>>;

// Decoded parameter mapping (keys unique, later duplicates win)
using ParameterMap = std::map<std::string, std::string>;

// Custom-scheme URL as received from another application.
//
//   scheme://payload#fragment
//
// `payload` is everything between "://" and the fragment. It is nullopt when
// nothing follows the separator ("app://", "app:") and an empty-parameter
// string otherwise ("app://?" has payload "?").
struct Url {
  std::string scheme;
  std::optional<std::string> payload;
  std::string fragment;
  std::string raw;

  // Parse `text`; returns nullopt if there is no valid scheme
  static std::optional<Url> parse(const std::string& text);

  bool has_payload() const {
    return payload.has_value();
  }

  // Parameter mapping carried by the payload. Uses the part after the first
  // '?' when present, otherwise the payload with leading '/' stripped.
  ParameterMap parameters() const;

  // Parameters found anywhere after the scheme: every '?'-separated segment
  // of the payload plus the fragment, later occurrences winning
  ParameterMap all_parameters() const;
};

// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& value);

// Decode %XX sequences; malformed sequences are kept verbatim
std::string url_decode(const std::string& value);

// "k1=v1&k2=v2" with keys and values percent-encoded
std::string query_string_from_parameters(const QueryParameters& params);

// Inverse of query_string_from_parameters. Empty keys are dropped, a pair
// without '=' maps to "".
ParameterMap parameters_from_query_string(const std::string& query);

// ASCII case-insensitive equality
bool iequals(const std::string& a, const std::string& b);

}  // namespace ssokit::net
