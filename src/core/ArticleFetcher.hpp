#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../interfaces/IArticleExtractor.hpp"
#include "../interfaces/IHttpTransport.hpp"
#include "../network/RequestContext.hpp"
#include "../utils/UrlUtil.hpp"

namespace ReadServe {

struct FetchOptions {
    size_t max_body_bytes = 2 * 1024 * 1024;
    std::string default_accept_language = "en-US,en;q=0.9";
};

struct FetchOutcome {
    std::optional<Article> article;
    std::string final_url;
    std::string error;

    bool ok() const { return article.has_value(); }
};

// Downloads a page the way a browser navigation would and extracts its article.
class ArticleFetcher {
public:
    ArticleFetcher(IHttpTransport& transport, IArticleExtractor& extractor, FetchOptions options = {});

    // accept_language is the client's header, forwarded when non-empty.
    FetchOutcome Fetch(const RequestContext& ctx, const TargetUrl& url, const std::string& accept_language);

    // Outbound headers for one request, with a User-Agent picked from the pool.
    HeaderList BuildHeaders(const std::string& accept_language) const;

    static const std::vector<std::string>& UserAgentPool();

private:
    IHttpTransport& transport_;
    IArticleExtractor& extractor_;
    FetchOptions options_;
};

}
