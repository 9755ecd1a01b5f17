#include "net/url.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace ssokit::net {

namespace {

bool is_scheme_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

// ============================================================
// Url
// ============================================================

std::optional<Url> Url::parse(const std::string& text) {
  size_t colon = text.find(':');
  if (colon == std::string::npos || colon == 0) {
    return std::nullopt;
  }

  // RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
  if (!std::isalpha(static_cast<unsigned char>(text[0]))) {
    return std::nullopt;
  }
  for (size_t i = 1; i < colon; i++) {
    if (!is_scheme_char(text[i])) {
      return std::nullopt;
    }
  }

  Url url;
  url.raw = text;
  url.scheme = text.substr(0, colon);

  std::string rest = text.substr(colon + 1);
  size_t hash = rest.find('#');
  if (hash != std::string::npos) {
    url.fragment = rest.substr(hash + 1);
    rest.erase(hash);
  }

  if (rest.compare(0, 2, "//") == 0) {
    rest.erase(0, 2);
  }
  if (!rest.empty()) {
    url.payload = rest;
  }

  return url;
}

ParameterMap Url::parameters() const {
  if (!payload) {
    return {};
  }

  const std::string& text = *payload;
  size_t question = text.find('?');
  if (question != std::string::npos) {
    return parameters_from_query_string(text.substr(question + 1));
  }

  size_t start = text.find_first_not_of('/');
  if (start == std::string::npos) {
    return {};
  }
  return parameters_from_query_string(text.substr(start));
}

ParameterMap Url::all_parameters() const {
  ParameterMap params;

  auto merge = [&params](const std::string& query) {
    for (auto& [key, value] : parameters_from_query_string(query)) {
      params[key] = std::move(value);
    }
  };

  if (payload) {
    size_t start = payload->find_first_not_of('/');
    while (start != std::string::npos && start < payload->size()) {
      size_t question = payload->find('?', start);
      merge(payload->substr(start, question == std::string::npos ? std::string::npos : question - start));
      start = question == std::string::npos ? question : question + 1;
    }
  }
  merge(fragment);

  return params;
}

// ============================================================
// Encoding
// ============================================================

std::string url_encode(const std::string& value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (char c : value) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << std::uppercase;
      escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
      escaped << std::nouppercase;
    }
  }

  return escaped.str();
}

std::string url_decode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());

  for (size_t i = 0; i < value.size(); i++) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int hi = hex_value(value[i + 1]);
      int lo = hex_value(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    decoded += value[i];
  }

  return decoded;
}

std::string query_string_from_parameters(const QueryParameters& params) {
  std::ostringstream query;
  bool first = true;
  for (const auto& [key, value] : params) {
    if (!first) query << "&";
    query << url_encode(key) << "=" << url_encode(value);
    first = false;
  }
  return query.str();
}

ParameterMap parameters_from_query_string(const std::string& query) {
  ParameterMap params;

  size_t pos = 0;
  while (pos <= query.size()) {
    size_t amp = query.find('&', pos);
    if (amp == std::string::npos) {
      amp = query.size();
    }

    std::string pair = query.substr(pos, amp - pos);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      std::string key = url_decode(pair.substr(0, eq));
      std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
      if (!key.empty()) {
        params[key] = value;
      }
    }

    pos = amp + 1;
  }

  return params;
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); i++) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace ssokit::net
