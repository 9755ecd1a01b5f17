#include "ssokit/ssokit.hpp"

#include "core/version.hpp"
#include "log/log.h"

namespace ssokit {

void init(const Config& config) {
  init_log(config);
}

std::string version() {
  return SSOKIT_VERSION_STRING;
}

}  // namespace ssokit
