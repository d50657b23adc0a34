#pragma once
#include "../core/ReaderHandler.hpp"
#include "HttpServer.hpp"

namespace ReadServe {

// Adapts Beast requests and replies to ReaderHandler. Every path is served; only GET is allowed.
class ReaderEndpoint {
public:
    explicit ReaderEndpoint(const ReaderHandler& handler) : handler_(handler) {}

    HttpReply operator()(const HttpRequest& req, const RequestContext& ctx) const;

    static ReaderRequest ToReaderRequest(const HttpRequest& req, const RequestContext& ctx);
    static HttpReply ToReply(const Response& response, unsigned version);

private:
    const ReaderHandler& handler_;
};

}
