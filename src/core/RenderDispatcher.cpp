#include "RenderDispatcher.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "../parser/MarkdownConverter.hpp"
#include "../utils/Logger.hpp"

namespace ReadServe {

std::optional<OutputFormat> ParseOutputFormat(const std::string& token) {
    if (token == "html") return OutputFormat::Html;
    if (token == "md" || token == "markdown") return OutputFormat::Markdown;
    if (token == "json") return OutputFormat::Json;
    if (token == "text" || token == "txt") return OutputFormat::Text;
    return std::nullopt;
}

const char* ToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Html:     return "html";
        case OutputFormat::Markdown: return "markdown";
        case OutputFormat::Json:     return "json";
        case OutputFormat::Text:     return "text";
    }
    return "unknown";
}

RenderDispatcher::RenderDispatcher(const HtmlTemplate& html_template) : template_(html_template) {}

RenderResult RenderDispatcher::Render(Response& response, const Article& article, const std::string& format_token) const {
    auto format = ParseOutputFormat(format_token);
    if (!format) {
        return {RenderStatus::InvalidFormat, "invalid format: " + format_token};
    }
    return Render(response, article, *format);
}

RenderResult RenderDispatcher::Render(Response& response, const Article& article, OutputFormat format) const {
    try {
        switch (format) {
            case OutputFormat::Html:     RenderHtml(response, article); break;
            case OutputFormat::Markdown: RenderMarkdown(response, article); break;
            case OutputFormat::Json:     RenderJson(response, article); break;
            case OutputFormat::Text:     RenderText(response, article); break;
        }
    } catch (const std::exception& e) {
        std::string message = std::string("rendering ") + ToString(format) + " failed: " + e.what();
        if (!response.Committed()) {
            return {RenderStatus::Failed, message};
        }
        Logger::Log(LogLevel::Error, message + " (response already started)");
    }
    return {};
}

void RenderDispatcher::RenderHtml(Response& response, const Article& article) const {
    std::string page = template_.Render(article.title, article.content);
    response.SetHeader("Content-Type", "text/html; charset=utf-8");
    response.Write(page);
}

void RenderDispatcher::RenderMarkdown(Response& response, const Article& article) const {
    std::string markdown = MarkdownConverter::Convert(article.content);
    response.SetHeader("Content-Type", "text/markdown");
    response.Write(markdown);
}

void RenderDispatcher::RenderJson(Response& response, const Article& article) const {
    nlohmann::json body = {
        {"title", article.title},
        {"content", article.content}
    };
    // Invalid UTF-8 from the page becomes U+FFFD instead of failing the request.
    std::string encoded = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    response.SetHeader("Content-Type", "application/json");
    response.Write(encoded + "\n");
}

void RenderDispatcher::RenderText(Response& response, const Article& article) const {
    response.SetHeader("Content-Type", "text/plain; charset=utf-8");
    response.Write(article.content);
}

}
