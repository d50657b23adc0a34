#pragma once
#include <chrono>
#include <string>
#include "../interfaces/IHttpTransport.hpp"
#include "IpPolicy.hpp"

namespace ReadServe {

struct SafeTransportOptions {
    long max_redirects = 5;
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds dial_timeout{30000};
    IpPolicy::Predicate is_forbidden = [](const boost::asio::ip::address& a) { return IpPolicy::IsForbidden(a); };
};

// HTTP client that refuses to reach private networks.
//
// Every hop (the initial URL and each redirect target) is normalized, its host resolved,
// and all resolved addresses checked against the IP policy. The checked addresses are
// pinned into the connection so libcurl never resolves the name again, and the socket
// open hook checks the exact address being dialed. Redirects are followed here, never
// by libcurl; a chain may issue at most max_redirects requests.
class SafeTransport : public IHttpTransport {
public:
    explicit SafeTransport(SafeTransportOptions options = {});

    SafeTransport(const SafeTransport&) = delete;
    SafeTransport& operator=(const SafeTransport&) = delete;

    HttpResponse Get(const std::string& url, const HeaderList& headers, size_t max_bytes, const RequestContext& ctx) override;

    static constexpr const char* kForbiddenMessage = "refusing to connect to private network address";

private:
    struct HopResult;
    HopResult PerformHop(const std::string& url, const HeaderList& headers, size_t max_bytes, const RequestContext& ctx);

    SafeTransportOptions options_;
};

}
