#include "sso/redirect_validator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ssokit::sso {

std::string to_string(RedirectKind kind) {
  switch (kind) {
    case RedirectKind::Success:
      return "success";
    case RedirectKind::Cancel:
      return "cancel";
    case RedirectKind::Unrecognized:
      return "unrecognized";
  }
  return "unrecognized";
}

std::string to_string(ValidatorState state) {
  switch (state) {
    case ValidatorState::Pending:
      return "pending";
    case ValidatorState::Resolved:
      return "resolved";
  }
  return "pending";
}

// ============================================================
// Construction
// ============================================================

RedirectValidator::RedirectValidator(AuthConfig config, RedirectOptions options, crypto::SecureRandomSource* random)
    : config_(std::move(config)), options_(std::move(options)) {
  if (config_.consumer_key.empty()) {
    throw std::invalid_argument("consumer key must not be empty");
  }
  if (config_.consumer_secret.empty()) {
    throw std::invalid_argument("consumer secret must not be empty");
  }

  options_.nonce_bytes = std::clamp(options_.nonce_bytes, SsoProtocol::MIN_NONCE_BYTES, SsoProtocol::MAX_NONCE_BYTES);

  redirect_scheme_ = options_.scheme_prefix + "-" + config_.consumer_key;
  nonce_ = generate_nonce(random ? *random : crypto::default_random_source());
  authorization_url_ = build_authorization_url(config_.consumer_key, config_.consumer_secret, redirect_scheme_, nonce_,
                                               options_.auth_endpoint);

  spdlog::debug("[SSO] Validator created for scheme {} (nonce: {})", redirect_scheme_, nonce_.empty() ? "none" : "set");
}

std::string RedirectValidator::generate_nonce(crypto::SecureRandomSource& random) {
  auto nonce = crypto::random_base64(random, options_.nonce_bytes);
  if (nonce) {
    return *nonce;
  }

  if (options_.require_nonce) {
    throw NonceGenerationError("secure random source failed, cannot generate SSO nonce");
  }

  // Redirects will not be bound to this request
  spdlog::warn("[SSO] Nonce generation failed for scheme {}, identifier check disabled", redirect_scheme_);
  nonce_failed_ = true;
  return "";
}

std::string RedirectValidator::build_authorization_url(const std::string& consumer_key,
                                                       const std::string& consumer_secret,
                                                       const std::string& redirect_scheme, const std::string& nonce,
                                                       const std::string& auth_endpoint) {
  net::QueryParameters params = {
      {SsoProtocol::CONSUMER_KEY, consumer_key},
      {SsoProtocol::CONSUMER_SECRET, consumer_secret},
      {SsoProtocol::OAUTH_CALLBACK, redirect_scheme},
  };
  if (!nonce.empty()) {
    params.emplace_back(SsoProtocol::IDENTIFIER, nonce);
  }

  return auth_endpoint + "?" + net::query_string_from_parameters(params);
}

// ============================================================
// Classification
// ============================================================

bool RedirectValidator::is_redirect_scheme(const std::string& scheme) const {
  // The authorizing app may lowercase the callback scheme
  return net::iequals(scheme, redirect_scheme_);
}

bool RedirectValidator::is_success_url(const net::Url& url) {
  if (!is_redirect_scheme(url.scheme)) {
    return false;
  }

  auto params = url.parameters();
  for (const char* key : {SsoProtocol::SECRET, SsoProtocol::TOKEN, SsoProtocol::USERNAME, SsoProtocol::IDENTIFIER}) {
    if (params.find(key) == params.end()) {
      spdlog::debug("[SSO] Redirect is missing '{}' parameter", key);
      return false;
    }
  }

  mark_resolved(RedirectKind::Success);
  return true;
}

bool RedirectValidator::is_success_url(const std::string& url) {
  auto parsed = net::Url::parse(url);
  return parsed && is_success_url(*parsed);
}

bool RedirectValidator::is_cancel_url(const net::Url& url) {
  if (!is_redirect_scheme(url.scheme) || url.has_payload()) {
    return false;
  }

  mark_resolved(RedirectKind::Cancel);
  return true;
}

bool RedirectValidator::is_cancel_url(const std::string& url) {
  auto parsed = net::Url::parse(url);
  return parsed && is_cancel_url(*parsed);
}

RedirectKind RedirectValidator::classify(const std::string& url) {
  auto parsed = net::Url::parse(url);
  if (!parsed) {
    spdlog::debug("[SSO] Ignoring unparseable redirect URL");
    return RedirectKind::Unrecognized;
  }

  if (is_success_url(*parsed)) {
    return RedirectKind::Success;
  }
  if (is_cancel_url(*parsed)) {
    return RedirectKind::Cancel;
  }
  return RedirectKind::Unrecognized;
}

void RedirectValidator::mark_resolved(RedirectKind kind) {
  if (state_ == ValidatorState::Pending) {
    spdlog::info("[SSO] Redirect for {} resolved as {}", redirect_scheme_, to_string(kind));
    state_ = ValidatorState::Resolved;
  }
}

// ============================================================
// Verification
// ============================================================

bool RedirectValidator::verify_nonce(const net::Url& url) const {
  if (nonce_.empty()) {
    return true;
  }

  auto params = url.parameters();
  auto it = params.find(SsoProtocol::IDENTIFIER);
  if (it == params.end()) {
    spdlog::warn("[SSO] Redirect carries no identifier");
    return false;
  }

  if (it->second != nonce_) {
    spdlog::warn("[SSO] Redirect identifier does not match this request");
    return false;
  }
  return true;
}

bool RedirectValidator::verify_nonce(const std::string& url) const {
  auto parsed = net::Url::parse(url);
  return parsed && verify_nonce(*parsed);
}

bool RedirectValidator::verify_oauth_token(const net::Url& url, const SessionStore& store) const {
  auto params = url.all_parameters();
  auto it = params.find(SsoProtocol::OAUTH_TOKEN);
  std::string token = it == params.end() ? "" : it->second;

  bool valid = store.is_valid_oauth_token(token);
  if (!valid) {
    spdlog::warn("[SSO] Session store rejected redirect token");
  }
  return valid;
}

bool RedirectValidator::verify_oauth_token(const std::string& url, const SessionStore& store) const {
  auto parsed = net::Url::parse(url);
  return parsed && verify_oauth_token(*parsed, store);
}

bool RedirectValidator::verify(const std::string& url, const SessionStore& store) const {
  auto parsed = net::Url::parse(url);
  if (!parsed) {
    return false;
  }
  return verify_nonce(*parsed) && verify_oauth_token(*parsed, store);
}

// ============================================================
// Scheme resolution
// ============================================================

bool RedirectValidator::has_valid_url_scheme(const HostAppConfig& host) const {
  return find_registered_scheme(host, redirect_scheme_).has_value();
}

std::string RedirectValidator::resolve_redirect_scheme(const HostAppConfig& host) const {
  if (has_valid_url_scheme(host)) {
    return redirect_scheme_;
  }

  spdlog::warn("[SSO] URL scheme {} is not registered by the host app, falling back to {}", redirect_scheme_,
               options_.fallback_scheme);
  return options_.fallback_scheme;
}

}  // namespace ssokit::sso
