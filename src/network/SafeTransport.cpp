#include "SafeTransport.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <new>
#include <optional>
#include "HostResolver.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace {

// State for one libcurl transfer (one redirect hop)
struct TransferContext {
    std::string buffer;
    size_t max_bytes = 0;
    bool truncated = false;
    const ReadServe::RequestContext* request = nullptr;
    const ReadServe::IpPolicy::Predicate* is_forbidden = nullptr;
    bool blocked = false;
    std::string blocked_address;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

struct CurlEasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

bool AppendSlist(CurlSlistPtr& list, const std::string& entry) {
    curl_slist* next = curl_slist_append(list.get(), entry.c_str());
    if (!next) return false;
    list.release();
    list.reset(next);
    return true;
}

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    size_t remaining_space = ctx->max_bytes - ctx->buffer.size();
    size_t to_copy = std::min(chunk, remaining_space);

    if (to_copy > 0) {
        try {
            ctx->buffer.append(static_cast<char*>(contents), to_copy);
        } catch (const std::bad_alloc&) {
            return 0; // Indicates an error
        }
    }

    if (to_copy < chunk) {
        // Cap reached: stop the transfer instead of draining an unbounded body.
        ctx->truncated = true;
        return 0;
    }
    return chunk;
}

int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    return (ctx && ctx->request && ctx->request->Cancelled()) ? 1 : 0;
}

std::optional<boost::asio::ip::address> ToAddress(const curl_sockaddr* address) {
    if (address->family == AF_INET && address->addrlen >= sizeof(sockaddr_in)) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&address->addr);
        return boost::asio::ip::address(boost::asio::ip::address_v4(ntohl(sin->sin_addr.s_addr)));
    }
    if (address->family == AF_INET6 && address->addrlen >= sizeof(sockaddr_in6)) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&address->addr);
        boost::asio::ip::address_v6::bytes_type bytes;
        std::memcpy(bytes.data(), sin6->sin6_addr.s6_addr, bytes.size());
        return boost::asio::ip::address(boost::asio::ip::address_v6(bytes, sin6->sin6_scope_id));
    }
    return std::nullopt;
}

// Dial hook: last check on the exact address libcurl is about to connect to.
curl_socket_t OpenSocketCallback(void* clientp, curlsocktype purpose, curl_sockaddr* address) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    if (purpose == CURLSOCKTYPE_IPCXN) {
        auto addr = ToAddress(address);
        if (!addr || (*ctx->is_forbidden)(*addr)) {
            ctx->blocked = true;
            ctx->blocked_address = addr ? addr->to_string() : std::string("unknown address family");
            return CURL_SOCKET_BAD;
        }
    }
    return socket(address->family, address->socktype, address->protocol);
}

bool IsRedirectStatus(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string PinEntry(const std::string& host, const std::string& port, const std::vector<boost::asio::ip::address>& addresses) {
    std::string entry = host + ":" + port + ":";
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (i > 0) entry.push_back(',');
        if (addresses[i].is_v6()) {
            entry += "[" + addresses[i].to_string() + "]";
        } else {
            entry += addresses[i].to_string();
        }
    }
    return entry;
}

} // anonymous namespace

namespace ReadServe {

const char* ToString(TransportError error) {
    switch (error) {
        case TransportError::None:             return "none";
        case TransportError::InvalidUrl:       return "invalid url";
        case TransportError::ForbiddenAddress: return "forbidden address";
        case TransportError::TooManyRedirects: return "too many redirects";
        case TransportError::Timeout:          return "timeout";
        case TransportError::Cancelled:        return "cancelled";
        case TransportError::Network:          return "network";
    }
    return "unknown";
}

struct SafeTransport::HopResult {
    HttpResponse response;
    std::string redirect_url;
};

SafeTransport::SafeTransport(SafeTransportOptions options) : options_(std::move(options)) {
    if (!options_.is_forbidden) {
        options_.is_forbidden = [](const boost::asio::ip::address& a) { return IpPolicy::IsForbidden(a); };
    }
}

HttpResponse SafeTransport::Get(const std::string& url, const HeaderList& headers, size_t max_bytes, const RequestContext& ctx) {
    // One budget for the whole redirect chain, DNS included.
    RequestContext call_ctx = ctx.WithTimeout(options_.request_timeout);

    std::string current = url;
    int redirects = 0;
    while (true) {
        HopResult hop = PerformHop(current, headers, max_bytes, call_ctx);
        hop.response.redirects = redirects;
        if (!hop.response.ok() || hop.redirect_url.empty()) {
            return std::move(hop.response);
        }

        // max_redirects bounds the total number of requests in the chain.
        if (redirects + 1 >= options_.max_redirects) {
            HttpResponse failed;
            failed.redirects = redirects;
            failed.effective_url = current;
            failed.error_kind = TransportError::TooManyRedirects;
            failed.error = "stopped after " + std::to_string(options_.max_redirects) + " redirects";
            return failed;
        }

        ++redirects;
        Logger::Log(LogLevel::Debug, "Following redirect " + std::to_string(redirects) + " from " + current + " to " + hop.redirect_url);
        current = hop.redirect_url;
    }
}

SafeTransport::HopResult SafeTransport::PerformHop(const std::string& url, const HeaderList& headers, size_t max_bytes, const RequestContext& ctx) {
    HopResult hop;
    HttpResponse& response = hop.response;
    response.effective_url = url;

    auto fail = [&response](TransportError kind, std::string message) {
        response.error_kind = kind;
        response.error = std::move(message);
    };

    // Every hop obeys the same scheme restriction as the user's URL.
    NormalizeResult normalized = UrlNormalizer::Normalize(url);
    if (!normalized.ok()) {
        fail(TransportError::InvalidUrl, "rejected URL " + url + ": " + normalized.error);
        return hop;
    }
    const TargetUrl& target = *normalized.url;

    if (ctx.Cancelled()) {
        fail(TransportError::Cancelled, "request cancelled");
        return hop;
    }
    if (ctx.Expired()) {
        fail(TransportError::Timeout, "request deadline exceeded");
        return hop;
    }

    ResolveResult resolved = HostResolver::Resolve(target.Host(), target.Port(), ctx);
    if (!resolved.ok()) {
        TransportError kind = resolved.cancelled ? TransportError::Cancelled
                            : resolved.timed_out ? TransportError::Timeout
                            : TransportError::Network;
        fail(kind, resolved.error);
        return hop;
    }
    for (const auto& addr : resolved.addresses) {
        if (options_.is_forbidden(addr)) {
            Logger::Log(LogLevel::Warn, "Blocked outbound fetch: " + target.Host() + " resolves to " + addr.to_string());
            fail(TransportError::ForbiddenAddress, kForbiddenMessage);
            return hop;
        }
    }

    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        fail(TransportError::Network, "failed to initialize cURL easy handle");
        return hop;
    }

    CurlSlistPtr pins;
    if (!target.HostIsIpLiteral() && !AppendSlist(pins, PinEntry(target.Host(), target.Port(), resolved.addresses))) {
        fail(TransportError::Network, "out of memory building resolve list");
        return hop;
    }
    CurlSlistPtr header_list;
    for (const auto& [name, value] : headers) {
        if (!AppendSlist(header_list, name + ": " + value)) {
            fail(TransportError::Network, "out of memory building header list");
            return hop;
        }
    }

    TransferContext transfer;
    transfer.max_bytes = max_bytes;
    transfer.request = &ctx;
    transfer.is_forbidden = &options_.is_forbidden;

    long timeout_ms = static_cast<long>(std::min(ctx.Remaining(), options_.request_timeout).count());
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, target.Href().c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(h, CURLOPT_OPENSOCKETFUNCTION, OpenSocketCallback);
    curl_easy_setopt(h, CURLOPT_OPENSOCKETDATA, &transfer);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, transfer.error_buffer);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, std::max(timeout_ms, 1L));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.dial_timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_PROXY, "");
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    if (pins) curl_easy_setopt(h, CURLOPT_RESOLVE, pins.get());
    if (header_list) curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());

    curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");

    CURLcode rc = curl_easy_perform(h);
    bool completed = rc == CURLE_OK || (rc == CURLE_WRITE_ERROR && transfer.truncated);

    if (!completed) {
        if (transfer.blocked) {
            Logger::Log(LogLevel::Warn, "Blocked dial to " + transfer.blocked_address + " for " + target.Host());
            fail(TransportError::ForbiddenAddress, kForbiddenMessage);
        } else if (rc == CURLE_OPERATION_TIMEDOUT) {
            fail(TransportError::Timeout, std::string("request timed out: ") + curl_easy_strerror(rc));
        } else if (rc == CURLE_ABORTED_BY_CALLBACK) {
            fail(TransportError::Cancelled, "request cancelled");
        } else {
            std::string detail = transfer.error_buffer;
            if (detail.empty()) detail = curl_easy_strerror(rc);
            fail(TransportError::Network, detail);
        }
        return hop;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    char* content_type = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }
    char* eff_url = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &eff_url) == CURLE_OK && eff_url) {
        response.effective_url = eff_url;
    }
    if (IsRedirectStatus(response.status_code)) {
        char* location = nullptr;
        if (curl_easy_getinfo(h, CURLINFO_REDIRECT_URL, &location) == CURLE_OK && location) {
            hop.redirect_url = location;
        }
    }

    response.truncated = transfer.truncated;
    response.content = std::move(transfer.buffer);
    if (response.truncated) {
        Logger::Log(LogLevel::Debug, "Response body from " + target.Href() + " truncated at " + std::to_string(max_bytes) + " bytes");
    }
    return hop;
}

}
