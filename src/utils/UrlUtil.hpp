#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ReadServe {

// Ordered query pairs; repeated keys are kept in arrival order.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Absolute http(s) URL with a non-empty host. Only UrlNormalizer can create one.
class TargetUrl {
public:
    const std::string& Href() const { return href_; }
    const std::string& Scheme() const { return scheme_; }
    // Host without IPv6 brackets.
    const std::string& Host() const { return host_; }
    // Explicit port, or the scheme's default.
    const std::string& Port() const { return port_; }
    bool HostIsIpLiteral() const { return host_is_ip_; }

private:
    friend class UrlNormalizer;
    TargetUrl() = default;

    std::string href_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    bool host_is_ip_ = false;
};

struct NormalizeResult {
    std::optional<TargetUrl> url;
    std::string error;

    bool ok() const { return url.has_value(); }
};

class UrlNormalizer {
public:
    // Turns user input into a validated TargetUrl:
    // - "" is rejected
    // - "http:/host" and "https:/host" (collapsed by proxies) are repaired
    // - input without a scheme gets "https://"
    // - anything but http/https is rejected
    static NormalizeResult Normalize(const std::string& raw);
};

namespace UrlUtil {

// Rebuilds the target URL when a rewrite layer split its query string into the inbound
// query: every inbound key except "url" and "format" is appended to the target's own query.
// Returns "" when no url parameter is present.
std::string ReconstructTargetUrl(const QueryParams& query);

// Parses "a=1&b=two+words&c=%2F" into ordered, percent-decoded pairs.
QueryParams ParseQuery(std::string_view raw_query);

// First value for key, or std::nullopt if the key is absent.
std::optional<std::string> QueryValue(const QueryParams& query, const std::string& key);

std::string PercentDecode(std::string_view s, bool plus_as_space);

// Percent-encode everything except RFC 3986 unreserved characters.
std::string UrlEncodeAll(std::string_view s);

// Resolve a possibly relative reference against an absolute base URL (RFC 3986).
// Returns std::nullopt when either side cannot be parsed.
std::optional<std::string> ResolveAgainst(const std::string& base_url, const std::string& candidate);

// Scheme of a URL reference in lowercase, "" for relative references.
// Control characters and whitespace are ignored, as browsers do.
std::string ReferenceScheme(std::string_view reference);

}
}
