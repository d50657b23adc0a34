#pragma once
#include <string>
#include <utility>
#include <vector>
#include "../network/RequestContext.hpp"

namespace ReadServe {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

enum class TransportError {
    None,
    InvalidUrl,
    ForbiddenAddress,
    TooManyRedirects,
    Timeout,
    Cancelled,
    Network
};

const char* ToString(TransportError error);

struct HttpResponse {
    long status_code = 0;
    std::string content;
    std::string content_type;
    std::string effective_url;
    bool truncated = false;
    int redirects = 0;
    TransportError error_kind = TransportError::None;
    std::string error;

    bool ok() const { return error_kind == TransportError::None; }
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    // GET url with the given headers. The body is cut at max_bytes.
    virtual HttpResponse Get(const std::string& url, const HeaderList& headers, size_t max_bytes, const RequestContext& ctx) = 0;
};

}
