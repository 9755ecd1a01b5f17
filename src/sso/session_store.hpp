#pragma once

#include <memory>
#include <string>

namespace ssokit::sso {

// Session store owned by the host application. The validator only asks it
// whether a token is one the store currently knows about.
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  virtual bool is_valid_oauth_token(const std::string& token) const = 0;
};

using SessionStorePtr = std::shared_ptr<SessionStore>;

}  // namespace ssokit::sso
