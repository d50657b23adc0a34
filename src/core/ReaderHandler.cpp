#include "ReaderHandler.hpp"
#include "../utils/Logger.hpp"
#include "FormatNegotiator.hpp"

namespace ReadServe {

ReaderHandler::ReaderHandler(ArticleFetcher& fetcher, const RenderDispatcher& renderer, ReaderOptions options)
    : fetcher_(fetcher), renderer_(renderer), options_(std::move(options)) {}

void ReaderHandler::ApplySecurityHeaders(Response& response) const {
    response.SetHeader("Content-Security-Policy", options_.content_security_policy);
    response.SetHeader("X-Content-Type-Options", "nosniff");
    response.SetHeader("X-Frame-Options", "DENY");
    response.SetHeader("Referrer-Policy", options_.referrer_policy);
}

Response ReaderHandler::Handle(const ReaderRequest& request) const {
    Response response;
    ApplySecurityHeaders(response);

    const std::string raw_link = UrlUtil::ReconstructTargetUrl(request.query);

    NegotiationInput negotiation;
    negotiation.format_param = UrlUtil::QueryValue(request.query, "format");
    negotiation.accept = request.accept;
    negotiation.user_agent = request.user_agent;
    const std::string format_token = FormatNegotiator::Select(negotiation);

    Logger::Log(LogLevel::Info, "request: " + format_token + " " + raw_link);

    // Unknown formats are refused before any network work.
    auto format = ParseOutputFormat(format_token);
    if (!format) {
        response.WriteError(400, "invalid format");
        return response;
    }

    NormalizeResult normalized = UrlNormalizer::Normalize(raw_link);
    if (!normalized.ok()) {
        Logger::Log(LogLevel::Warn, "error normalizing URL \"" + raw_link + "\": " + normalized.error);
        response.WriteError(400, "Invalid URL provided");
        return response;
    }

    RequestContext ctx = request.context.WithTimeout(options_.handler_timeout);
    FetchOutcome fetched = fetcher_.Fetch(ctx, *normalized.url, request.accept_language);
    if (!fetched.ok()) {
        // Detail stays in the log; clients cannot tell blocked, unreachable and unparsable apart.
        Logger::Log(LogLevel::Warn, "error fetching or parsing URL \"" + raw_link + "\": " + fetched.error);
        response.WriteError(422, "Failed to process URL");
        return response;
    }

    RenderResult rendered = renderer_.Render(response, *fetched.article, *format);
    if (!rendered.ok()) {
        Logger::Log(LogLevel::Error, "error rendering \"" + raw_link + "\": " + rendered.error);
        response.WriteError(500, "failed to render article content");
    }
    return response;
}

}
