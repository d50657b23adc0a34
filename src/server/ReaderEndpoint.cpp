#include "ReaderEndpoint.hpp"
#include "../utils/Logger.hpp"

namespace http = boost::beast::http;

namespace ReadServe {

ReaderRequest ReaderEndpoint::ToReaderRequest(const HttpRequest& req, const RequestContext& ctx) {
    ReaderRequest out;
    std::string target(req.target());
    auto question = target.find('?');
    if (question != std::string::npos) {
        out.query = UrlUtil::ParseQuery(std::string_view(target).substr(question + 1));
    }
    out.accept = std::string(req[http::field::accept]);
    out.user_agent = std::string(req[http::field::user_agent]);
    out.accept_language = std::string(req[http::field::accept_language]);
    out.context = ctx;
    return out;
}

HttpReply ReaderEndpoint::ToReply(const Response& response, unsigned version) {
    HttpReply reply(static_cast<http::status>(response.Status()), version);
    for (const auto& [name, value] : response.Headers()) {
        reply.set(name, value);
    }
    reply.body() = response.Body();
    return reply;
}

HttpReply ReaderEndpoint::operator()(const HttpRequest& req, const RequestContext& ctx) const {
    if (req.method() != http::verb::get) {
        Logger::Log(LogLevel::Info, "Rejected " + std::string(req.method_string()) + " " + std::string(req.target()));
        Response response;
        handler_.ApplySecurityHeaders(response);
        response.SetHeader("Allow", "GET");
        response.WriteError(405, "method not allowed");
        return ToReply(response, req.version());
    }
    return ToReply(handler_.Handle(ToReaderRequest(req, ctx)), req.version());
}

}
