#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "sso/host_app_config.hpp"
#include "sso/redirect_validator.hpp"

namespace ssokit {

using json = nlohmann::json;

// Application configuration
struct Config {
  // Consumer credentials
  std::string consumer_key;
  std::string consumer_secret;

  // Redirect settings
  std::string scheme_prefix = sso::SsoProtocol::SCHEME_PREFIX;
  std::string auth_endpoint = sso::SsoProtocol::AUTH_ENDPOINT;
  std::string fallback_scheme = sso::SsoProtocol::FALLBACK_SCHEME;
  size_t nonce_bytes = sso::SsoProtocol::DEFAULT_NONCE_BYTES;
  bool require_nonce = false;

  // URL schemes registered by the host application
  std::vector<sso::UrlType> url_types;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;
  size_t log_max_files = 5;  // rotated logs kept besides the current one

  // Load from file
  static Config load(const std::filesystem::path& path);
  static Config load_default();

  // load_default() with SSOKIT_* environment overrides
  static Config from_env();

  // Override credentials and scheme prefix from SSOKIT_* variables that are set
  void apply_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  bool has_credentials() const {
    return !consumer_key.empty() && !consumer_secret.empty();
  }

  sso::AuthConfig auth_config() const;
  sso::RedirectOptions redirect_options() const;
  sso::StaticHostAppConfig host_app_config() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();
std::filesystem::path config_dir();
std::filesystem::path default_config_file();
std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace ssokit
