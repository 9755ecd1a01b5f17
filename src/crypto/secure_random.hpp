#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ssokit::crypto {

// Source of cryptographically secure random bytes
class SecureRandomSource {
 public:
  virtual ~SecureRandomSource() = default;

  // Fill `buffer` with `n` random bytes. Returns false on failure, in which
  // case the buffer contents are unspecified.
  virtual bool fill(uint8_t* buffer, size_t n) = 0;
};

// OpenSSL RAND_bytes
class OpenSslRandomSource : public SecureRandomSource {
 public:
  bool fill(uint8_t* buffer, size_t n) override;
};

// Process-wide OpenSSL source, used when no source is injected
SecureRandomSource& default_random_source();

// Standard base64 (RFC 4648 alphabet, '=' padding, no line breaks)
std::string base64_encode(const std::vector<uint8_t>& data);

// `n` random bytes from `source`, base64-encoded. nullopt if the source fails.
std::optional<std::string> random_base64(SecureRandomSource& source, size_t n);

}  // namespace ssokit::crypto
