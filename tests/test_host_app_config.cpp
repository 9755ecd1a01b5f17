#include <gtest/gtest.h>

#include "sso/host_app_config.hpp"

using namespace ssokit::sso;

// --- UrlType Tests ---

TEST(UrlTypeTest, FromJson) {
  json j = {{"role", "Viewer"}, {"url_schemes", {"twitterkit-k8Uf0x", 42, "appscheme83289239"}}};

  auto url_type = UrlType::from_json(j);

  EXPECT_EQ(url_type.role, "Viewer");
  ASSERT_EQ(url_type.url_schemes.size(), 2u);
  EXPECT_EQ(url_type.url_schemes[0], "twitterkit-k8Uf0x");
  EXPECT_EQ(url_type.url_schemes[1], "appscheme83289239");
}

TEST(UrlTypeTest, FromJsonDefaults) {
  auto url_type = UrlType::from_json(json::object());

  EXPECT_EQ(url_type.role, "Editor");
  EXPECT_TRUE(url_type.url_schemes.empty());
}

TEST(UrlTypeTest, ToJson) {
  UrlType url_type{"Editor", {"twitterkit-abc"}};
  auto j = url_type.to_json();

  EXPECT_EQ(j["role"], "Editor");
  ASSERT_TRUE(j["url_schemes"].is_array());
  EXPECT_EQ(j["url_schemes"][0], "twitterkit-abc");
}

// --- StaticHostAppConfig Tests ---

TEST(StaticHostAppConfigTest, CollectsSchemesAcrossUrlTypes) {
  StaticHostAppConfig host(std::vector<UrlType>{
      UrlType{"Editor", {"twitterkit-k8Uf0x"}},
      UrlType{"Editor", {"appscheme83289239", "", "twitterkit-k8Uf0x"}},
  });

  auto schemes = host.registered_url_schemes();

  EXPECT_EQ(schemes.size(), 2u);
  EXPECT_EQ(schemes.count("twitterkit-k8Uf0x"), 1u);
  EXPECT_EQ(schemes.count("appscheme83289239"), 1u);
  EXPECT_EQ(host.url_types().size(), 2u);
}

TEST(StaticHostAppConfigTest, Empty) {
  StaticHostAppConfig host;

  EXPECT_TRUE(host.registered_url_schemes().empty());
  EXPECT_FALSE(find_registered_scheme(host, "twitterkit-abc").has_value());
}

TEST(StaticHostAppConfigTest, FindRegisteredSchemeIgnoresCase) {
  StaticHostAppConfig host;
  host.add_url_type(UrlType{"Editor", {"TwitterKit-ABC"}});

  auto found = find_registered_scheme(host, "twitterkit-abc");

  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, "TwitterKit-ABC");
  EXPECT_FALSE(find_registered_scheme(host, "twitterkit-ab").has_value());
}
