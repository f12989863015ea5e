#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "app_registry.hpp"
#include "origin_validator.hpp"
#include "store/dial_data_store.hpp"
#include "test_helpers.hpp"

using testing_support::fake_app;
using testing_support::app_spy;
using testing_support::make_descriptor;
using testing_support::memory_file_store;

TEST(OriginHost, StripsSchemePortAndPath)
{
    EXPECT_EQ(dial::origin_host("https://Example.com:8443/path"), "example.com");
    EXPECT_EQ(dial::origin_host("https://www.youtube.com"), "www.youtube.com");
    EXPECT_EQ(dial::origin_host("https://user@host.tv"), "host.tv");
    EXPECT_EQ(dial::origin_host("https://[::1]:443"), "[::1]");
    EXPECT_EQ(dial::origin_host("www.netflix.com"), "www.netflix.com");
}

TEST(HostMatches, ExactHostIgnoresPort)
{
    EXPECT_TRUE(dial::host_matches("https://www.youtube.com:443", "https://www.youtube.com"));
    EXPECT_TRUE(dial::host_matches("https://WWW.YouTube.com", "https://www.youtube.com:8443"));
    EXPECT_FALSE(dial::host_matches("https://m.youtube.com", "https://www.youtube.com"));
}

TEST(HostMatches, LeadingDotMatchesDomainAndSubdomains)
{
    EXPECT_TRUE(dial::host_matches("https://www.netflix.com", ".netflix.com"));
    EXPECT_TRUE(dial::host_matches("https://a.b.netflix.com:443", ".netflix.com"));
    EXPECT_TRUE(dial::host_matches("https://netflix.com", ".netflix.com"));
    EXPECT_FALSE(dial::host_matches("https://evilnetflix.com", ".netflix.com"));
    EXPECT_FALSE(dial::host_matches("https://netflix.com.evil.org", ".netflix.com"));
}

TEST(OriginMatches, PatternAnchoredAtStart)
{
    EXPECT_TRUE(dial::origin_matches("package:com.google.android.youtube", "package:com\\.google\\..*"));
    EXPECT_TRUE(dial::origin_matches("http://localhost:8080", "http://localhost"));
    EXPECT_FALSE(dial::origin_matches("xpackage:com.google.android.youtube", "package:com\\.google\\..*"));
    EXPECT_FALSE(dial::origin_matches("http://example.com", "http://localhost"));
}

TEST(OriginMatches, InvalidPatternNeverMatches)
{
    EXPECT_FALSE(dial::origin_matches("http://localhost", "(unbalanced"));
}

TEST(IsUriInList, SchemeSelectsComparison)
{
    const std::vector<std::string> origins {".youtube.com", "package:com\\.google\\.android\\.youtube"};

    EXPECT_TRUE(dial::is_uri_in_list("https://www.youtube.com", origins));
    EXPECT_TRUE(dial::is_uri_in_list("HTTPS://www.youtube.com", origins));
    EXPECT_TRUE(dial::is_uri_in_list("package:com.google.android.youtube", origins));
    EXPECT_FALSE(dial::is_uri_in_list("https://www.vimeo.com", origins));
    // Plain http is matched as a pattern, ".youtube.com" is not one for this origin
    EXPECT_FALSE(dial::is_uri_in_list("http://www.youtube.com", origins));
    EXPECT_FALSE(dial::is_uri_in_list("", origins));
    EXPECT_FALSE(dial::is_uri_in_list("https://www.youtube.com", {}));
}

TEST(IsAllowedOrigin, ConsultsTheRegisteredApplication)
{
    memory_file_store files;
    store::dial_data_store data_store {files};
    dial::app_registry registry {data_store};
    registry.register_app(std::make_unique<fake_app>(make_descriptor("YouTube", {".youtube.com"}),
        std::make_shared<app_spy>()));

    EXPECT_TRUE(dial::is_allowed_origin(registry, std::nullopt, "YouTube"));
    EXPECT_TRUE(dial::is_allowed_origin(registry, std::string {}, "YouTube"));
    EXPECT_TRUE(dial::is_allowed_origin(registry, std::string {"https://www.youtube.com"}, "YouTube"));
    EXPECT_FALSE(dial::is_allowed_origin(registry, std::string {"https://www.example.com"}, "YouTube"));
    EXPECT_FALSE(dial::is_allowed_origin(registry, std::string {"https://www.youtube.com"}, "Netflix"));
}
