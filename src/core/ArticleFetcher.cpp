#include "ArticleFetcher.hpp"
#include <random>
#include "../utils/Logger.hpp"

namespace {

const std::string& PickUserAgent() {
    thread_local std::mt19937 rng{std::random_device{}()};
    const auto& pool = ReadServe::ArticleFetcher::UserAgentPool();
    std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
    return pool[dist(rng)];
}

}

namespace ReadServe {

ArticleFetcher::ArticleFetcher(IHttpTransport& transport, IArticleExtractor& extractor, FetchOptions options)
    : transport_(transport), extractor_(extractor), options_(std::move(options)) {}

const std::vector<std::string>& ArticleFetcher::UserAgentPool() {
    // Current desktop and mobile browsers; default client strings get blocked.
    static const std::vector<std::string> pool = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/134.0.0.0 Safari/537.36 Edg/134.0.0.0",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/133.0.0.0 Safari/537.36",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/133.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:135.0) Gecko/20100101 Firefox/135.0",
        "Mozilla/5.0 (iPhone; CPU iPhone OS 18_3 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/18.3 Mobile/15E148 Safari/604.1",
    };
    return pool;
}

HeaderList ArticleFetcher::BuildHeaders(const std::string& accept_language) const {
    return {
        {"User-Agent", PickUserAgent()},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,image/apng,*/*;q=0.8"},
        {"Accept-Language", accept_language.empty() ? options_.default_accept_language : accept_language},
        {"Cache-Control", "no-cache"},
        {"Pragma", "no-cache"},
        {"Sec-Ch-Ua-Mobile", "?0"},
        {"Sec-Fetch-Dest", "document"},
        {"Sec-Fetch-Mode", "navigate"},
        {"Sec-Fetch-Site", "none"},
        {"Sec-Fetch-User", "?1"},
        {"Upgrade-Insecure-Requests", "1"},
    };
}

FetchOutcome ArticleFetcher::Fetch(const RequestContext& ctx, const TargetUrl& url, const std::string& accept_language) {
    FetchOutcome outcome;
    outcome.final_url = url.Href();

    HttpResponse response = transport_.Get(url.Href(), BuildHeaders(accept_language), options_.max_body_bytes, ctx);
    if (!response.ok()) {
        outcome.error = std::string("fetch failed (") + ToString(response.error_kind) + "): " + response.error;
        return outcome;
    }
    if (!response.effective_url.empty()) {
        outcome.final_url = response.effective_url;
    }

    Logger::Log(LogLevel::Debug, "Fetched " + outcome.final_url + ": status " + std::to_string(response.status_code) +
        ", " + std::to_string(response.content.size()) + " bytes" +
        (response.truncated ? " (truncated)" : "") +
        ", " + std::to_string(response.redirects) + " redirects");

    ExtractResult extracted = extractor_.Extract(response.content, outcome.final_url);
    if (!extracted.ok()) {
        outcome.error = "extract failed: " + extracted.error;
        return outcome;
    }
    outcome.article = std::move(extracted.article);
    return outcome;
}

}
