// SSO redirect CLI
//
// Prints the authorization URL for one sign-in attempt, then reads redirect
// URLs from stdin until one of them resolves the attempt.
//
//   sso_cli [--config <path>] [--key <consumer key>] [--secret <consumer secret>]
//           [--token <valid oauth token>]... [--log-level <level>]
#include <iostream>
#include <optional>
#include <set>
#include <string>

#include "ssokit/ssokit.hpp"

using namespace ssokit;

namespace {

// Accepts the tokens passed with --token
class TokenListSessionStore : public sso::SessionStore {
 public:
  void add(const std::string& token) {
    tokens_.insert(token);
  }

  bool is_valid_oauth_token(const std::string& token) const override {
    return !token.empty() && tokens_.count(token) > 0;
  }

 private:
  std::set<std::string> tokens_;
};

void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--config <path>] [--key <consumer key>] [--secret <consumer secret>]"
               " [--token <oauth token>]... [--log-level <level>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  // Layering: config file, then SSOKIT_* environment, then flags
  std::optional<std::string> config_path;
  for (int i = 1; i + 1 < argc; i++) {
    if (std::string(argv[i]) == "--config") {
      config_path = argv[i + 1];
    }
  }

  Config config = config_path ? Config::load(*config_path) : Config::load_default();
  config.apply_env();
  TokenListSessionStore store;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: missing value for " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }

    std::string value = argv[++i];
    if (arg == "--config") {
      continue;
    } else if (arg == "--key") {
      config.consumer_key = value;
    } else if (arg == "--secret") {
      config.consumer_secret = value;
    } else if (arg == "--token") {
      store.add(value);
    } else if (arg == "--log-level") {
      config.log_level = value;
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  if (!config.has_credentials()) {
    std::cerr << "Error: No consumer credentials. Set SSOKIT_CONSUMER_KEY and SSOKIT_CONSUMER_SECRET or pass --key/--secret\n";
    return 1;
  }

  ssokit::init(config);

  try {
    sso::RedirectValidator validator(config.auth_config(), config.redirect_options());
    auto host = config.host_app_config();

    std::cout << "ssokit v" << ssokit::version() << "\n";
    std::cout << "Authorization URL: " << validator.authorization_url() << "\n";
    std::cout << "Redirect scheme:   " << validator.resolve_redirect_scheme(host) << "\n";
    if (validator.nonce_generation_failed()) {
      std::cout << "Warning: no nonce, redirects are not bound to this request\n";
    }
    std::cout << "Paste redirect URLs (Ctrl-D to quit):\n";

    std::string line;
    while (validator.state() == sso::ValidatorState::Pending && std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }

      auto kind = validator.classify(line);
      std::cout << sso::to_string(kind);
      if (kind == sso::RedirectKind::Success) {
        bool nonce_ok = validator.verify_nonce(line);
        bool token_ok = validator.verify_oauth_token(line, store);
        std::cout << " (identifier " << (nonce_ok ? "ok" : "mismatch") << ", token " << (token_ok ? "ok" : "rejected") << ")";
      }
      std::cout << "\n";
    }
  } catch (const sso::NonceGenerationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
