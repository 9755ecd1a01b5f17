#include <gtest/gtest.h>

#include "crypto/secure_random.hpp"

using namespace ssokit::crypto;

namespace {

class FailingRandomSource : public SecureRandomSource {
 public:
  bool fill(uint8_t*, size_t) override {
    return false;
  }
};

}  // namespace

// --- base64 Tests ---

TEST(Base64Test, KnownVectors) {
  auto encode = [](const std::string& s) { return base64_encode(std::vector<uint8_t>(s.begin(), s.end())); };

  EXPECT_EQ(encode(""), "");
  EXPECT_EQ(encode("f"), "Zg==");
  EXPECT_EQ(encode("fo"), "Zm8=");
  EXPECT_EQ(encode("foo"), "Zm9v");
  EXPECT_EQ(encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, StandardAlphabet) {
  std::vector<uint8_t> data = {0xFB, 0xFF, 0xBF};

  EXPECT_EQ(base64_encode(data), "+/+/");
}

TEST(Base64Test, LongInputHasNoLineBreaks) {
  std::vector<uint8_t> data(96, 0x00);
  auto encoded = base64_encode(data);

  EXPECT_EQ(encoded.size(), 128u);
  EXPECT_EQ(encoded.find('\n'), std::string::npos);
}

// --- Random source Tests ---

TEST(SecureRandomTest, OpenSslFillsBuffer) {
  OpenSslRandomSource source;
  std::vector<uint8_t> a(48);
  std::vector<uint8_t> b(48);

  ASSERT_TRUE(source.fill(a.data(), a.size()));
  ASSERT_TRUE(source.fill(b.data(), b.size()));
  EXPECT_NE(a, b);
}

TEST(SecureRandomTest, RandomBase64Length) {
  auto value = random_base64(default_random_source(), 48);

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value->size(), 64u);
}

TEST(SecureRandomTest, RandomBase64ReportsFailure) {
  FailingRandomSource source;

  EXPECT_FALSE(random_base64(source, 48).has_value());
}
