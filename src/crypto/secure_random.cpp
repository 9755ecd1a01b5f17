#include "crypto/secure_random.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <climits>

namespace ssokit::crypto {

bool OpenSslRandomSource::fill(uint8_t* buffer, size_t n) {
  if (n > static_cast<size_t>(INT_MAX)) {
    return false;
  }
  if (RAND_bytes(buffer, static_cast<int>(n)) != 1) {
    unsigned long err = ERR_get_error();
    char err_buf[256];
    ERR_error_string_n(err, err_buf, sizeof(err_buf));
    spdlog::error("[Crypto] RAND_bytes failed: {}", err_buf);
    return false;
  }
  return true;
}

SecureRandomSource& default_random_source() {
  static OpenSslRandomSource source;
  return source;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return "";
  }

  // 4 output chars per 3 input bytes, plus NUL written by EVP_EncodeBlock
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), data.data(), static_cast<int>(data.size()));
  encoded.resize(static_cast<size_t>(len));
  return encoded;
}

std::optional<std::string> random_base64(SecureRandomSource& source, size_t n) {
  std::vector<uint8_t> bytes(n);
  if (!source.fill(bytes.data(), bytes.size())) {
    return std::nullopt;
  }
  return base64_encode(bytes);
}

}  // namespace ssokit::crypto
