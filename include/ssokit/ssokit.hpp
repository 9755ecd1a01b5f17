#pragma once

// Core
#include "core/config.hpp"

// URL handling
#include "net/url.hpp"

// Randomness
#include "crypto/secure_random.hpp"

// Single sign-on
#include "sso/host_app_config.hpp"
#include "sso/redirect_validator.hpp"
#include "sso/session_store.hpp"

namespace ssokit {

// Initialize logging from `config`
void init(const Config& config);

// Get version string
std::string version();

}  // namespace ssokit
