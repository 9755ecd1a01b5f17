#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ssokit::sso {

using json = nlohmann::json;

// One entry of the host application's URL type list, e.g.
//   { "role": "Editor", "url_schemes": ["twitterkit-k8Uf0x"] }
struct UrlType {
  std::string role = "Editor";
  std::vector<std::string> url_schemes;

  json to_json() const;
  static UrlType from_json(const json& j);
};

// URL schemes the host application has registered with the platform
class HostAppConfig {
 public:
  virtual ~HostAppConfig() = default;

  virtual std::set<std::string> registered_url_schemes() const = 0;
};

// HostAppConfig over a fixed list of URL types (loaded from config or built in tests)
class StaticHostAppConfig : public HostAppConfig {
 public:
  StaticHostAppConfig() = default;
  explicit StaticHostAppConfig(std::vector<UrlType> url_types);

  void add_url_type(UrlType url_type);

  const std::vector<UrlType>& url_types() const {
    return url_types_;
  }

  std::set<std::string> registered_url_schemes() const override;

 private:
  std::vector<UrlType> url_types_;
};

// Registered scheme matching `scheme` case-insensitively, as spelled by the host
std::optional<std::string> find_registered_scheme(const HostAppConfig& host, const std::string& scheme);

}  // namespace ssokit::sso
