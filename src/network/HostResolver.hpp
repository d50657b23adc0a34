#pragma once
#include <string>
#include <vector>
#include <boost/asio/ip/address.hpp>
#include "RequestContext.hpp"

namespace ReadServe {

struct ResolveResult {
    std::vector<boost::asio::ip::address> addresses;
    std::string error;
    bool timed_out = false;
    bool cancelled = false;

    bool ok() const { return error.empty(); }
};

class HostResolver {
public:
    // Resolves host to every address it maps to. The lookup runs on its own worker so the
    // caller returns when ctx expires or is cancelled even if the system resolver hangs;
    // a late answer is discarded.
    static ResolveResult Resolve(const std::string& host, const std::string& port, const RequestContext& ctx);
};

}
