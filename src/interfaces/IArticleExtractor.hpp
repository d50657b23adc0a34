#pragma once
#include <optional>
#include <string>

namespace ReadServe {

struct Article {
    std::string title;
    // Sanitized HTML of the readable body. Safe to embed as-is.
    std::string content;
};

struct ExtractResult {
    std::optional<Article> article;
    std::string error;

    bool ok() const { return article.has_value(); }
};

class IArticleExtractor {
public:
    virtual ~IArticleExtractor() = default;
    // source_url is the final URL of the fetched document; relative links resolve against it.
    virtual ExtractResult Extract(const std::string& html_content, const std::string& source_url) = 0;
};

}
