#include "sso/host_app_config.hpp"

#include "net/url.hpp"

namespace ssokit::sso {

json UrlType::to_json() const {
  return json{{"role", role}, {"url_schemes", url_schemes}};
}

UrlType UrlType::from_json(const json& j) {
  UrlType url_type;
  url_type.role = j.value("role", "Editor");
  if (j.contains("url_schemes")) {
    for (const auto& scheme : j["url_schemes"]) {
      if (scheme.is_string()) {
        url_type.url_schemes.push_back(scheme.get<std::string>());
      }
    }
  }
  return url_type;
}

StaticHostAppConfig::StaticHostAppConfig(std::vector<UrlType> url_types) : url_types_(std::move(url_types)) {}

void StaticHostAppConfig::add_url_type(UrlType url_type) {
  url_types_.push_back(std::move(url_type));
}

std::set<std::string> StaticHostAppConfig::registered_url_schemes() const {
  std::set<std::string> schemes;
  for (const auto& url_type : url_types_) {
    for (const auto& scheme : url_type.url_schemes) {
      if (!scheme.empty()) {
        schemes.insert(scheme);
      }
    }
  }
  return schemes;
}

std::optional<std::string> find_registered_scheme(const HostAppConfig& host, const std::string& scheme) {
  for (const auto& registered : host.registered_url_schemes()) {
    if (net::iequals(registered, scheme)) {
      return registered;
    }
  }
  return std::nullopt;
}

}  // namespace ssokit::sso
