#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "crypto/secure_random.hpp"
#include "net/url.hpp"
#include "sso/host_app_config.hpp"
#include "sso/session_store.hpp"

namespace ssokit::sso {

// Consumer credentials identifying the calling application
struct AuthConfig {
  std::string consumer_key;
  std::string consumer_secret;
};

// Protocol constants of the native-app SSO exchange
struct SsoProtocol {
  static constexpr const char* AUTH_ENDPOINT = "twitterauth://authorize";
  static constexpr const char* SCHEME_PREFIX = "twitterkit";
  static constexpr const char* FALLBACK_SCHEME = "twittersdk";

  // Outbound parameters
  static constexpr const char* CONSUMER_KEY = "consumer_key";
  static constexpr const char* CONSUMER_SECRET = "consumer_secret";
  static constexpr const char* OAUTH_CALLBACK = "oauth_callback";
  static constexpr const char* IDENTIFIER = "identifier";

  // Inbound parameters
  static constexpr const char* SECRET = "secret";
  static constexpr const char* TOKEN = "token";
  static constexpr const char* USERNAME = "username";
  static constexpr const char* OAUTH_TOKEN = "oauth_token";

  static constexpr size_t MIN_NONCE_BYTES = 32;
  static constexpr size_t DEFAULT_NONCE_BYTES = 48;
  static constexpr size_t MAX_NONCE_BYTES = 1024;
};

struct RedirectOptions {
  std::string scheme_prefix = SsoProtocol::SCHEME_PREFIX;
  std::string auth_endpoint = SsoProtocol::AUTH_ENDPOINT;
  std::string fallback_scheme = SsoProtocol::FALLBACK_SCHEME;
  size_t nonce_bytes = SsoProtocol::DEFAULT_NONCE_BYTES;  // clamped to [MIN_NONCE_BYTES, MAX_NONCE_BYTES]

  // Throw NonceGenerationError instead of continuing with an empty nonce
  bool require_nonce = false;
};

// Thrown only when RedirectOptions::require_nonce is set
class NonceGenerationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class RedirectKind { Success, Cancel, Unrecognized };

enum class ValidatorState { Pending, Resolved };

std::string to_string(RedirectKind kind);
std::string to_string(ValidatorState state);

// Builds the outbound authorization URL for one SSO attempt and checks the
// redirect that comes back.
//
// One instance per attempt: the nonce generated at construction binds the
// outbound request to its inbound redirect. Not thread-safe.
class RedirectValidator {
 public:
  // `random` defaults to the OpenSSL source. Throws std::invalid_argument on
  // empty credentials.
  explicit RedirectValidator(AuthConfig config, RedirectOptions options = {}, crypto::SecureRandomSource* random = nullptr);

  static std::string build_authorization_url(const std::string& consumer_key, const std::string& consumer_secret,
                                             const std::string& redirect_scheme, const std::string& nonce,
                                             const std::string& auth_endpoint = SsoProtocol::AUTH_ENDPOINT);

  const std::string& authorization_url() const {
    return authorization_url_;
  }

  const std::string& redirect_scheme() const {
    return redirect_scheme_;
  }

  // Empty if the random source failed
  const std::string& nonce() const {
    return nonce_;
  }

  bool nonce_generation_failed() const {
    return nonce_failed_;
  }

  ValidatorState state() const {
    return state_;
  }

  const AuthConfig& auth_config() const {
    return config_;
  }

  // Scheme matches and secret, token, username and identifier are all present
  bool is_success_url(const net::Url& url);
  bool is_success_url(const std::string& url);

  // Scheme matches and the URL carries no payload
  bool is_cancel_url(const net::Url& url);
  bool is_cancel_url(const std::string& url);

  RedirectKind classify(const std::string& url);

  // The identifier parameter equals the nonce. Always true when the nonce is
  // empty: redirects from callers that never sent one still pass.
  bool verify_nonce(const net::Url& url) const;
  bool verify_nonce(const std::string& url) const;

  bool verify_oauth_token(const net::Url& url, const SessionStore& store) const;
  bool verify_oauth_token(const std::string& url, const SessionStore& store) const;

  // verify_nonce && verify_oauth_token
  bool verify(const std::string& url, const SessionStore& store) const;

  bool is_redirect_scheme(const std::string& scheme) const;

  // Host registered our redirect scheme
  bool has_valid_url_scheme(const HostAppConfig& host) const;

  // Redirect scheme if registered by the host, fallback scheme otherwise
  std::string resolve_redirect_scheme(const HostAppConfig& host) const;

 private:
  std::string generate_nonce(crypto::SecureRandomSource& random);

  void mark_resolved(RedirectKind kind);

  AuthConfig config_;
  RedirectOptions options_;
  std::string redirect_scheme_;
  std::string nonce_;
  bool nonce_failed_ = false;
  std::string authorization_url_;
  ValidatorState state_ = ValidatorState::Pending;
};

}  // namespace ssokit::sso
