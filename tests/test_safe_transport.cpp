#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include "core/ArticleFetcher.hpp"
#include "core/HtmlTemplate.hpp"
#include "core/ReaderHandler.hpp"
#include "core/RenderDispatcher.hpp"
#include "network/SafeTransport.hpp"
#include "parser/ArticleExtractor.hpp"
#include "server/HttpServer.hpp"
#include "server/ReaderEndpoint.hpp"
#include "utils/UrlUtil.hpp"

using namespace ReadServe;
namespace http = boost::beast::http;

namespace {

HttpReply MakeReply(const HttpRequest& req, http::status status, std::string body, const std::string& content_type = "text/html; charset=utf-8") {
    HttpReply res(status, req.version());
    res.set(http::field::content_type, content_type);
    res.body() = std::move(body);
    return res;
}

HttpReply Redirect(const HttpRequest& req, const std::string& location) {
    HttpReply res(http::status::found, req.version());
    res.set(http::field::location, location);
    return res;
}

// Local target site. Counts every request it receives.
struct TargetSite {
    std::atomic<int> hits{0};
    HttpServer server;

    TargetSite() : server("127.0.0.1", 0, [this](const HttpRequest& req, const RequestContext&) { return Serve(req); }) {
        server.Start();
    }

    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(server.Port()) + path;
    }

    HttpReply Serve(const HttpRequest& req) {
        ++hits;
        std::string target(req.target());
        if (target == "/metadata") return Redirect(req, "http://169.254.169.254/latest/meta-data/");
        if (target == "/ftp") return Redirect(req, "ftp://example.com/file.txt");
        if (target == "/loop") return Redirect(req, "/loop");
        if (target.rfind("/chain/", 0) == 0) {
            int left = std::stoi(target.substr(7));
            if (left > 0) return Redirect(req, "/chain/" + std::to_string(left - 1));
            return MakeReply(req, http::status::ok, "<p>end of chain</p>");
        }
        if (target == "/big") return MakeReply(req, http::status::ok, std::string(3 * 1024 * 1024, 'a'));
        if (target == "/slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            return MakeReply(req, http::status::ok, "<p>late</p>");
        }
        if (target == "/headers") {
            return MakeReply(req, http::status::ok, std::string(req[http::field::user_agent]) + "|" + std::string(req[http::field::accept_language]), "text/plain");
        }
        if (target == "/xss") {
            return MakeReply(req, http::status::ok, R"(<!DOCTYPE html>
<html>
<head><title>Hacked Title</title></head>
<body>
    <p>Safe content</p>
    <script>alert('XSS')</script>
    <img src="x" onerror="alert(1)">
    <a href="javascript:alert(1)">Click me</a>
    <iframe src="javascript:alert(1)"></iframe>
</body>
</html>)");
        }
        if (target == "/missing") return MakeReply(req, http::status::not_found, "<p>gone</p>");
        return MakeReply(req, http::status::ok, "<p>hello</p>");
    }
};

// Every rule of the default policy except loopback, so a local server can play the remote site.
SafeTransportOptions LoopbackAllowed() {
    SafeTransportOptions options;
    options.is_forbidden = [](const boost::asio::ip::address& addr) {
        return !addr.is_loopback() && IpPolicy::IsForbidden(addr);
    };
    return options;
}

constexpr size_t kCap = 2 * 1024 * 1024;

}

TEST_CASE("SafeTransport refuses loopback targets without reaching them") {
    TargetSite site;
    SafeTransport transport;

    auto r = transport.Get(site.Url("/"), {}, kCap, RequestContext());
    CHECK(r.error_kind == TransportError::ForbiddenAddress);
    CHECK(r.error.find("refusing to connect to private network address") != std::string::npos);
    CHECK(site.hits == 0);
}

TEST_CASE("SafeTransport refuses the unspecified address") {
    SafeTransport transport;
    auto r = transport.Get("http://0.0.0.0:8080", {}, kCap, RequestContext());
    CHECK(r.error_kind == TransportError::ForbiddenAddress);
    CHECK(r.error == SafeTransport::kForbiddenMessage);
}

TEST_CASE("SafeTransport refuses names that resolve to loopback") {
    SafeTransport transport;
    auto r = transport.Get("http://localhost:9/", {}, kCap, RequestContext::Timeout(std::chrono::milliseconds(3000)));
    CHECK(r.error_kind == TransportError::ForbiddenAddress);
}

TEST_CASE("SafeTransport fetches a permitted target") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto r = transport.Get(site.Url("/"), {}, kCap, RequestContext());
    REQUIRE(r.ok());
    CHECK(r.status_code == 200);
    CHECK(r.content == "<p>hello</p>");
    CHECK(r.content_type == "text/html; charset=utf-8");
    CHECK_FALSE(r.truncated);
    CHECK(site.hits == 1);
}

TEST_CASE("SafeTransport returns non-2xx responses as-is") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());
    auto r = transport.Get(site.Url("/missing"), {}, kCap, RequestContext());
    REQUIRE(r.ok());
    CHECK(r.status_code == 404);
    CHECK(r.content == "<p>gone</p>");
}

TEST_CASE("SafeTransport sends the given headers") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());
    HeaderList headers = {{"User-Agent", "TestAgent/1.0"}, {"Accept-Language", "fr-FR"}};
    auto r = transport.Get(site.Url("/headers"), headers, kCap, RequestContext());
    REQUIRE(r.ok());
    CHECK(r.content == "TestAgent/1.0|fr-FR");
}

TEST_CASE("SafeTransport blocks a redirect to a forbidden address") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto r = transport.Get(site.Url("/metadata"), {}, kCap, RequestContext());
    CHECK(r.error_kind == TransportError::ForbiddenAddress);
    CHECK(r.error == SafeTransport::kForbiddenMessage);
    CHECK(site.hits == 1);
}

TEST_CASE("SafeTransport blocks a redirect to a non-http scheme") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto r = transport.Get(site.Url("/ftp"), {}, kCap, RequestContext());
    CHECK(r.error_kind == TransportError::InvalidUrl);
    CHECK(site.hits == 1);
}

TEST_CASE("SafeTransport follows a chain of four redirects") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto r = transport.Get(site.Url("/chain/4"), {}, kCap, RequestContext());
    REQUIRE(r.ok());
    CHECK(r.content == "<p>end of chain</p>");
    CHECK(r.redirects == 4);
    CHECK(r.effective_url == site.Url("/chain/0"));
    CHECK(site.hits == 5);
}

TEST_CASE("SafeTransport refuses the fifth redirect") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto r = transport.Get(site.Url("/chain/5"), {}, kCap, RequestContext());
    CHECK(r.error_kind == TransportError::TooManyRedirects);
    CHECK(r.error == "stopped after 5 redirects");
    CHECK(site.hits == 5);
}

TEST_CASE("SafeTransport stops a redirect loop") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto r = transport.Get(site.Url("/loop"), {}, kCap, RequestContext());
    CHECK(r.error_kind == TransportError::TooManyRedirects);
    CHECK(r.error == "stopped after 5 redirects");
    CHECK(site.hits == 5);
}

TEST_CASE("SafeTransport truncates bodies at the cap") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto r = transport.Get(site.Url("/big"), {}, kCap, RequestContext());
    REQUIRE(r.ok());
    CHECK(r.truncated);
    CHECK(r.content.size() == kCap);
}

TEST_CASE("SafeTransport gives up at the request deadline") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    auto start = std::chrono::steady_clock::now();
    auto r = transport.Get(site.Url("/slow"), {}, kCap, RequestContext::Timeout(std::chrono::milliseconds(200)));
    auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(r.error_kind == TransportError::Timeout);
    CHECK(elapsed < std::chrono::milliseconds(900));
}

TEST_CASE("SafeTransport does nothing for a cancelled request") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());

    RequestContext ctx;
    ctx.Cancel();
    auto r = transport.Get(site.Url("/"), {}, kCap, ctx);
    CHECK(r.error_kind == TransportError::Cancelled);
    CHECK(site.hits == 0);
}

TEST_CASE("Malicious markup is neutralized end to end") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());
    ArticleExtractor extractor;
    ArticleFetcher fetcher(transport, extractor);
    HtmlTemplate tpl;
    RenderDispatcher renderer(tpl);
    ReaderHandler handler(fetcher, renderer);

    ReaderRequest req;
    req.query = {{"url", site.Url("/xss")}, {"format", "html"}};
    Response r = handler.Handle(req);
    REQUIRE(r.Status() == 200);

    const std::string& page = r.Body();
    // The page template's own theme script is the only script element.
    auto script_count = [&page]() {
        size_t n = 0;
        for (auto pos = page.find("<script"); pos != std::string::npos; pos = page.find("<script", pos + 1)) ++n;
        return n;
    };
    CHECK(script_count() == 1);
    CHECK(page.find("<script>") == std::string::npos);
    CHECK(page.find("onerror") == std::string::npos);
    CHECK(page.find("javascript:") == std::string::npos);
    CHECK(page.find("alert(") == std::string::npos);
    CHECK(page.find("iframe") == std::string::npos);
    CHECK(page.find("Safe content") != std::string::npos);
    CHECK(page.find("<h1>Hacked Title</h1>") != std::string::npos);
}

TEST_CASE("Reader endpoint serves over HTTP and refuses other methods") {
    TargetSite site;
    SafeTransport transport(LoopbackAllowed());
    ArticleExtractor extractor;
    ArticleFetcher fetcher(transport, extractor);
    HtmlTemplate tpl;
    RenderDispatcher renderer(tpl);
    ReaderHandler handler(fetcher, renderer);
    ReaderEndpoint endpoint(handler);

    HttpRequest get(http::verb::get, "/api?url=" + UrlUtil::UrlEncodeAll(site.Url("/")) + "&format=json", 11);
    HttpReply ok = endpoint(get, RequestContext());
    CHECK(ok.result() == http::status::ok);
    CHECK(std::string(ok[http::field::content_type]) == "application/json");
    CHECK(std::string(ok["X-Frame-Options"]) == "DENY");
    CHECK(ok.body().find("hello") != std::string::npos);

    HttpRequest post(http::verb::post, "/api?url=example.com", 11);
    HttpReply refused = endpoint(post, RequestContext());
    CHECK(refused.result() == http::status::method_not_allowed);
    CHECK(refused.body() == "{\"error\":\"method not allowed\"}\n");
    CHECK(std::string(refused["X-Content-Type-Options"]) == "nosniff");
}
