#pragma once
#include <chrono>
#include <string>
#include "../network/RequestContext.hpp"
#include "../utils/UrlUtil.hpp"
#include "ArticleFetcher.hpp"
#include "RenderDispatcher.hpp"
#include "Response.hpp"

namespace ReadServe {

// One inbound request, independent of the HTTP library that received it.
struct ReaderRequest {
    QueryParams query;
    std::string accept;
    std::string user_agent;
    std::string accept_language;
    RequestContext context;
};

struct ReaderOptions {
    std::chrono::milliseconds handler_timeout{5000};
    std::string content_security_policy = "default-src 'self'; script-src 'self' https://bookmarklet-theme.vercel.app; style-src 'self' https://unpkg.com;";
    std::string referrer_policy = "no-referrer-when-downgrade";
};

class ReaderHandler {
public:
    ReaderHandler(ArticleFetcher& fetcher, const RenderDispatcher& renderer, ReaderOptions options = {});

    Response Handle(const ReaderRequest& request) const;

    void ApplySecurityHeaders(Response& response) const;

private:
    ArticleFetcher& fetcher_;
    const RenderDispatcher& renderer_;
    ReaderOptions options_;
};

}
