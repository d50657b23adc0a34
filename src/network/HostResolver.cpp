#include "HostResolver.hpp"
#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "../utils/Logger.hpp"

namespace {

struct LookupState {
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    ReadServe::ResolveResult result;
};

ReadServe::ResolveResult Lookup(const std::string& host, const std::string& port) {
    ReadServe::ResolveResult r;
    try {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver resolver(ioc);
        boost::system::error_code ec;
        auto results = resolver.resolve(host, port, ec);
        if (ec) {
            r.error = "lookup " + host + ": " + ec.message();
            return r;
        }
        for (const auto& entry : results) {
            auto addr = entry.endpoint().address();
            if (std::find(r.addresses.begin(), r.addresses.end(), addr) == r.addresses.end()) {
                r.addresses.push_back(addr);
            }
        }
    } catch (const std::exception& e) {
        r.error = "lookup " + host + ": " + e.what();
        return r;
    }
    if (r.addresses.empty()) {
        r.error = "lookup " + host + ": no addresses found";
    }
    return r;
}

}

namespace ReadServe {

ResolveResult HostResolver::Resolve(const std::string& host, const std::string& port, const RequestContext& ctx) {
    auto state = std::make_shared<LookupState>();

    std::thread([state, host, port]() {
        ResolveResult r = Lookup(host, port);
        {
            std::lock_guard<std::mutex> lock(state->mtx);
            state->result = std::move(r);
            state->done = true;
        }
        state->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(state->mtx);
    while (!state->done) {
        if (ctx.Cancelled()) {
            ResolveResult r;
            r.cancelled = true;
            r.error = "lookup " + host + ": request cancelled";
            return r;
        }
        if (ctx.Expired()) {
            Logger::Log(LogLevel::Debug, "DNS lookup for " + host + " still running at deadline, abandoning it");
            ResolveResult r;
            r.timed_out = true;
            r.error = "lookup " + host + ": deadline exceeded";
            return r;
        }
        // Wake periodically to observe cancellation.
        auto slice = std::min(ctx.Remaining(), std::chrono::milliseconds(50));
        state->cv.wait_for(lock, slice, [&state] { return state->done; });
    }
    return std::move(state->result);
}

}
