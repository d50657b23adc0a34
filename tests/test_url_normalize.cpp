#include <catch2/catch_all.hpp>
#include "utils/UrlUtil.hpp"

using namespace ReadServe;

TEST_CASE("UrlNormalizer rejects empty input") {
    auto r = UrlNormalizer::Normalize("");
    CHECK_FALSE(r.ok());
    CHECK(r.error == "url parameter is empty");
}

TEST_CASE("UrlNormalizer defaults to https when the scheme is missing") {
    auto r = UrlNormalizer::Normalize("example.com");
    REQUIRE(r.ok());
    CHECK(r.url->Href() == "https://example.com");
    CHECK(r.url->Scheme() == "https");
    CHECK(r.url->Host() == "example.com");
    CHECK(r.url->Port() == "443");
    CHECK_FALSE(r.url->HostIsIpLiteral());
}

TEST_CASE("UrlNormalizer repairs a collapsed scheme separator") {
    auto http = UrlNormalizer::Normalize("http:/foo.bar");
    REQUIRE(http.ok());
    CHECK(http.url->Href() == "http://foo.bar");
    CHECK(http.url->Port() == "80");

    auto https = UrlNormalizer::Normalize("https:/foo.bar/a?b=c");
    REQUIRE(https.ok());
    CHECK(https.url->Href() == "https://foo.bar/a?b=c");
}

TEST_CASE("UrlNormalizer rejects schemes other than http and https") {
    auto ftp = UrlNormalizer::Normalize("ftp://x");
    CHECK_FALSE(ftp.ok());
    CHECK(ftp.error == "unsupported URL scheme");

    CHECK_FALSE(UrlNormalizer::Normalize("gopher://example.com/").ok());
    CHECK_FALSE(UrlNormalizer::Normalize("file:///etc/passwd").ok());
    CHECK_FALSE(UrlNormalizer::Normalize("javascript:alert(1)").ok());
}

TEST_CASE("UrlNormalizer keeps explicit ports and IP literal hosts") {
    auto v6 = UrlNormalizer::Normalize("http://[::1]:8080/x");
    REQUIRE(v6.ok());
    CHECK(v6.url->Host() == "::1");
    CHECK(v6.url->Port() == "8080");
    CHECK(v6.url->HostIsIpLiteral());

    auto v4 = UrlNormalizer::Normalize("http://127.0.0.1/");
    REQUIRE(v4.ok());
    CHECK(v4.url->Host() == "127.0.0.1");
    CHECK(v4.url->HostIsIpLiteral());
}

TEST_CASE("ParseQuery decodes pairs in order") {
    auto q = UrlUtil::ParseQuery("?url=http%3A%2F%2Fexample.com%3Ffoo%3Dbar&a=two+words&a=again&flag");
    REQUIRE(q.size() == 4);
    CHECK(q[0].first == "url");
    CHECK(q[0].second == "http://example.com?foo=bar");
    CHECK(q[1].second == "two words");
    CHECK(q[2].first == "a");
    CHECK(q[2].second == "again");
    CHECK(q[3].first == "flag");
    CHECK(q[3].second.empty());
    CHECK(UrlUtil::QueryValue(q, "a") == std::optional<std::string>("two words"));
    CHECK_FALSE(UrlUtil::QueryValue(q, "missing").has_value());
}

TEST_CASE("ReconstructTargetUrl merges query parameters split off by a rewrite layer") {
    struct Case { const char* name; const char* query; const char* expected; };
    const Case cases[] = {
        {"simple url", "url=http://example.com", "http://example.com"},
        {"url with encoded params", "url=http%3A%2F%2Fexample.com%3Ffoo%3Dbar", "http://example.com?foo=bar"},
        {"split params", "url=http://example.com&foo=bar&baz=qux", "http://example.com?foo=bar&baz=qux"},
        {"split params with existing params", "url=http://example.com?a=b&c=d", "http://example.com?a=b&c=d"},
        {"mixed params", "url=http%3A%2F%2Fexample.com%3Fa%3Db&c=d", "http://example.com?a=b&c=d"},
        {"ignore format param", "url=http://example.com&format=json&foo=bar", "http://example.com?foo=bar"},
        {"empty url", "format=json", ""},
    };
    for (const auto& c : cases) {
        INFO(c.name);
        CHECK(UrlUtil::ReconstructTargetUrl(UrlUtil::ParseQuery(c.query)) == c.expected);
    }
}

TEST_CASE("ReconstructTargetUrl keeps the fragment after the merged query") {
    auto q = UrlUtil::ParseQuery("url=" + UrlUtil::UrlEncodeAll("https://example.com/p#section") + "&page=2");
    CHECK(UrlUtil::ReconstructTargetUrl(q) == "https://example.com/p?page=2#section");
}

TEST_CASE("ReconstructTargetUrl is idempotent") {
    auto first = UrlUtil::ReconstructTargetUrl(UrlUtil::ParseQuery("url=http://example.com?a=b&c=d&format=md"));
    REQUIRE(first == "http://example.com?a=b&c=d");

    QueryParams again = {{"url", first}, {"format", "md"}};
    CHECK(UrlUtil::ReconstructTargetUrl(again) == first);
    CHECK(UrlUtil::ReconstructTargetUrl(QueryParams{{"url", first}}) == first);
}

TEST_CASE("ResolveAgainst handles protocol and relative URLs") {
    using UrlUtil::ResolveAgainst;

    std::string base = "https://example.com/path/page.html";
    CHECK(ResolveAgainst(base, "https://cdn.example.com/a.jpg") == "https://cdn.example.com/a.jpg");
    CHECK(ResolveAgainst(base, "//cdn.example.com/a.jpg") == "https://cdn.example.com/a.jpg");
    CHECK(ResolveAgainst(base, "/img/a.png") == "https://example.com/img/a.png");
    CHECK(ResolveAgainst(base, "img/a.png") == "https://example.com/path/img/a.png");
}

TEST_CASE("ReferenceScheme ignores control characters and case") {
    CHECK(UrlUtil::ReferenceScheme("JavaScript:alert(1)") == "javascript");
    CHECK(UrlUtil::ReferenceScheme("java\tscript:alert(1)") == "javascript");
    CHECK(UrlUtil::ReferenceScheme(" https://example.com") == "https");
    CHECK(UrlUtil::ReferenceScheme("/relative/path:with-colon") == "");
    CHECK(UrlUtil::ReferenceScheme("page.html") == "");
    CHECK(UrlUtil::ReferenceScheme("mailto:a@example.com") == "mailto");
}
