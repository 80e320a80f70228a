// ---------------------------------------------------------------------------
// test_url_parser.cpp
//
// parse_url / to_normalized_string 단위 테스트.
// 파싱 자체는 ada(WHATWG) 를 따르므로, 여기서는 검증기가 기대는
// 구성 요소 추출과 정규화 결과를 확인한다.
// ---------------------------------------------------------------------------

#include "validator/url_parser.hpp"

#include <gtest/gtest.h>

// ---------------------------------------------------------------------------
// 정상 파싱
// ---------------------------------------------------------------------------

TEST(UrlParser, SplitsAllComponents) {
    auto r = parse_url("https://user:pw@Example.COM:8443/a/b?q=1#frag");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->scheme, "https");
    EXPECT_EQ(r->username, "user");
    EXPECT_EQ(r->password, "pw");
    EXPECT_TRUE(r->has_credentials());
    EXPECT_EQ(r->host, "example.com");
    ASSERT_TRUE(r->port.has_value());
    EXPECT_EQ(*r->port, 8443);
    EXPECT_EQ(r->rest, "/a/b?q=1#frag");
}

TEST(UrlParser, HostOnlyGetsRootPath) {
    auto r = parse_url("https://github.com");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->host, "github.com");
    EXPECT_FALSE(r->port.has_value());
    EXPECT_FALSE(r->has_credentials());
    EXPECT_EQ(r->rest, "/");
}

TEST(UrlParser, DefaultPortIsDropped) {
    auto r = parse_url("https://github.com:443/x");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->port.has_value());
    EXPECT_EQ(r->rest, "/x");
}

TEST(UrlParser, QueryRightAfterHost) {
    auto r = parse_url("https://github.com?x=1");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->host, "github.com");
    EXPECT_EQ(r->rest, "/?x=1");
}

TEST(UrlParser, LastAtSignSeparatesUserinfo) {
    auto r = parse_url("https://a@b:c@host/x");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->host, "host");
    EXPECT_TRUE(r->has_credentials());
    EXPECT_EQ(r->username, "a%40b");
    EXPECT_EQ(r->password, "c");
}

TEST(UrlParser, AtSignInPathIsNotUserinfo) {
    auto r = parse_url("https://github.com/actions/checkout@v4");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->has_credentials());
    EXPECT_EQ(r->host, "github.com");
    EXPECT_EQ(r->rest, "/actions/checkout@v4");
}

TEST(UrlParser, Ipv6HostKeepsBrackets) {
    auto r = parse_url("http://[::1]:8080/health");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->host, "[::1]");
    ASSERT_TRUE(r->port.has_value());
    EXPECT_EQ(*r->port, 8080);
}

TEST(UrlParser, NonSpecialSchemeHostIsLowercased) {
    auto r = parse_url("SSH://GitHub.COM/owner/repo");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->scheme, "ssh");
    EXPECT_EQ(r->host, "github.com");
    EXPECT_EQ(r->rest, "/owner/repo");
}

TEST(UrlParser, PortUpperBoundAccepted) {
    auto r = parse_url("https://host:65535/");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->port.has_value());
    EXPECT_EQ(*r->port, 65535);
}

// ---------------------------------------------------------------------------
// 파싱 실패
// ---------------------------------------------------------------------------

TEST(UrlParser, MalformedInputs) {
    EXPECT_EQ(parse_url("github.com/owner/repo").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("://host").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("1http://host").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("https://exa mple.com/").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("https://[::1/").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("https://user@/path").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("").error(), UrlParseError::kMalformed);
}

TEST(UrlParser, InvalidPortIsMalformed) {
    EXPECT_EQ(parse_url("https://host:65536/").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("https://host:80a/").error(), UrlParseError::kMalformed);
    EXPECT_EQ(parse_url("https://host:123456/").error(), UrlParseError::kMalformed);
}

TEST(UrlParser, UrlsWithoutHostRejected) {
    EXPECT_EQ(parse_url("mailto:someone@example.com").error(), UrlParseError::kMissingHost);
    EXPECT_EQ(parse_url("javascript:alert(1)").error(), UrlParseError::kMissingHost);
    EXPECT_EQ(parse_url("file:///etc/passwd").error(), UrlParseError::kMissingHost);
}

// ---------------------------------------------------------------------------
// 정규화
// ---------------------------------------------------------------------------

TEST(UrlParser, NormalizationLowercasesSchemeAndHostOnly) {
    auto r = parse_url("HTTPS://GitHub.COM/Owner/Repo?Ref=Main");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(to_normalized_string(*r), "https://github.com/Owner/Repo?Ref=Main");
}

TEST(UrlParser, NormalizationKeepsNonDefaultPort) {
    auto r = parse_url("https://host:8443/x");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(to_normalized_string(*r), "https://host:8443/x");
}

TEST(UrlParser, NormalizationIsStable) {
    auto first = parse_url("HTTPS://Host:443");
    ASSERT_TRUE(first.has_value());
    const auto once = to_normalized_string(*first);
    EXPECT_EQ(once, "https://host/");

    auto second = parse_url(once);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(to_normalized_string(*second), once);
}

TEST(UrlParser, ErrorNames) {
    EXPECT_EQ(to_string(UrlParseError::kMalformed), "malformed URL");
    EXPECT_EQ(to_string(UrlParseError::kMissingHost), "URL has no host");
}
