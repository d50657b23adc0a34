#pragma once
#include <optional>
#include <string>
#include "../interfaces/IArticleExtractor.hpp"
#include "HtmlTemplate.hpp"
#include "Response.hpp"

namespace ReadServe {

enum class OutputFormat {
    Html,
    Markdown,
    Json,
    Text
};

// "html", "md" | "markdown", "json", "text" | "txt". Anything else is std::nullopt.
std::optional<OutputFormat> ParseOutputFormat(const std::string& token);
const char* ToString(OutputFormat format);

enum class RenderStatus {
    Ok,
    InvalidFormat,
    Failed
};

struct RenderResult {
    RenderStatus status = RenderStatus::Ok;
    std::string error;

    bool ok() const { return status == RenderStatus::Ok; }
};

class RenderDispatcher {
public:
    explicit RenderDispatcher(const HtmlTemplate& html_template);

    // Writes exactly one representation of the article. Failures before the first byte is
    // written are returned; failures after that can only be logged.
    RenderResult Render(Response& response, const Article& article, OutputFormat format) const;
    RenderResult Render(Response& response, const Article& article, const std::string& format_token) const;

private:
    void RenderHtml(Response& response, const Article& article) const;
    void RenderMarkdown(Response& response, const Article& article) const;
    void RenderJson(Response& response, const Article& article) const;
    void RenderText(Response& response, const Article& article) const;

    const HtmlTemplate& template_;
};

}
