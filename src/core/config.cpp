#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>

namespace ssokit {

namespace fs = std::filesystem;

namespace {

// Integer field within [min, max]; anything else keeps `fallback`
size_t bounded_size(const json& j, const char* key, size_t fallback, int64_t min, int64_t max, const fs::path& path) {
  if (!j.contains(key)) {
    return fallback;
  }

  const auto& value = j[key];
  if (value.is_number_integer()) {
    int64_t n = value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(max) ? max + 1 : value.get<int64_t>();
    if (n >= min && n <= max) {
      return static_cast<size_t>(n);
    }
  }

  spdlog::warn("Ignoring invalid {} {} in {}", key, value.dump(), path.string());
  return fallback;
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    config.consumer_key = j.value("consumer_key", "");
    config.consumer_secret = j.value("consumer_secret", "");

    config.scheme_prefix = j.value("scheme_prefix", sso::SsoProtocol::SCHEME_PREFIX);
    config.auth_endpoint = j.value("auth_endpoint", sso::SsoProtocol::AUTH_ENDPOINT);
    config.fallback_scheme = j.value("fallback_scheme", sso::SsoProtocol::FALLBACK_SCHEME);
    config.nonce_bytes = bounded_size(j, "nonce_bytes", config.nonce_bytes, 1, INT32_MAX, path);
    config.require_nonce = j.value("require_nonce", false);

    if (j.contains("url_types")) {
      for (const auto& url_type_json : j["url_types"]) {
        config.url_types.push_back(sso::UrlType::from_json(url_type_json));
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
    config.log_max_files = bounded_size(j, "log_max_files", config.log_max_files, 0, 1000, path);

  } catch (const json::exception& e) {
    spdlog::error("Failed to parse config file {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();
  config.apply_env();
  return config;
}

void Config::apply_env() {
  if (const char* key = std::getenv("SSOKIT_CONSUMER_KEY")) {
    consumer_key = key;
  }
  if (const char* secret = std::getenv("SSOKIT_CONSUMER_SECRET")) {
    consumer_secret = secret;
  }
  if (const char* prefix = std::getenv("SSOKIT_SCHEME_PREFIX")) {
    scheme_prefix = prefix;
  }
}

void Config::save(const fs::path& path) const {
  json j;

  j["consumer_key"] = consumer_key;
  j["consumer_secret"] = consumer_secret;
  j["scheme_prefix"] = scheme_prefix;
  j["auth_endpoint"] = auth_endpoint;
  j["fallback_scheme"] = fallback_scheme;
  j["nonce_bytes"] = nonce_bytes;
  j["require_nonce"] = require_nonce;

  json url_types_json = json::array();
  for (const auto& url_type : url_types) {
    url_types_json.push_back(url_type.to_json());
  }
  j["url_types"] = url_types_json;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  j["log_max_files"] = log_max_files;

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("Failed to write config file {}", path.string());
    return;
  }
  file << j.dump(2);
}

sso::AuthConfig Config::auth_config() const {
  return sso::AuthConfig{consumer_key, consumer_secret};
}

sso::RedirectOptions Config::redirect_options() const {
  sso::RedirectOptions options;
  options.scheme_prefix = scheme_prefix;
  options.auth_endpoint = auth_endpoint;
  options.fallback_scheme = fallback_scheme;
  options.nonce_bytes = nonce_bytes;
  options.require_nonce = require_nonce;
  return options;
}

sso::StaticHostAppConfig Config::host_app_config() const {
  return sso::StaticHostAppConfig(url_types);
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return home;
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "ssokit";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".ssokit" / "config.json";
}

}  // namespace config_paths

}  // namespace ssokit
