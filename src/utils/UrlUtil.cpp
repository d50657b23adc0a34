#include "UrlUtil.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

std::string GetPart(CURLU* h, CURLUPart part, unsigned int flags = 0) {
    char* out = nullptr;
    if (curl_url_get(h, part, &out, flags) != CURLUE_OK || out == nullptr) {
        return {};
    }
    std::string s(out);
    curl_free(out);
    return s;
}

static inline bool starts_with(const std::string& s, const char* pfx) {
    std::string_view p(pfx);
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

static inline bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

static inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

namespace ReadServe {

NormalizeResult UrlNormalizer::Normalize(const std::string& raw) {
    NormalizeResult result;
    if (raw.empty()) {
        result.error = "url parameter is empty";
        return result;
    }

    std::string link = raw;

    // Upstream proxies may collapse "://" into ":/"
    if (starts_with(link, "http:/") && !starts_with(link, "http://")) {
        link = "http://" + link.substr(6);
    } else if (starts_with(link, "https:/") && !starts_with(link, "https://")) {
        link = "https://" + link.substr(7);
    }

    if (link.find("://") == std::string::npos) {
        link = "https://" + link;
    }

    CurlUrlPtr h(curl_url());
    if (!h) {
        result.error = "invalid URL: out of memory";
        return result;
    }
    CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, link.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        result.error = std::string("invalid URL: ") + curl_url_strerror(rc);
        return result;
    }

    std::string scheme = GetPart(h.get(), CURLUPART_SCHEME);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (scheme != "http" && scheme != "https") {
        result.error = "unsupported URL scheme";
        return result;
    }

    std::string host = GetPart(h.get(), CURLUPART_HOST);
    if (host.empty()) {
        result.error = "invalid URL: missing host";
        return result;
    }

    TargetUrl url;
    url.href_ = link;
    url.scheme_ = scheme;
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        url.host_ = host.substr(1, host.size() - 2);
        url.host_is_ip_ = true;
    } else {
        url.host_ = host;
        url.host_is_ip_ = host.find_first_not_of("0123456789.") == std::string::npos;
    }
    url.port_ = GetPart(h.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
    if (url.port_.empty()) {
        url.port_ = (scheme == "https") ? "443" : "80";
    }

    result.url = std::move(url);
    return result;
}

namespace UrlUtil {

std::string ReconstructTargetUrl(const QueryParams& query) {
    auto raw = QueryValue(query, "url");
    if (!raw || raw->empty()) return "";

    std::string extra;
    for (const auto& [key, value] : query) {
        // Control parameters of this endpoint, never part of the target's query.
        if (key == "url" || key == "format") continue;
        if (!extra.empty()) extra.push_back('&');
        extra += UrlEncodeAll(key);
        extra.push_back('=');
        extra += UrlEncodeAll(value);
    }
    if (extra.empty()) return *raw;

    const std::string& link = *raw;
    auto hash = link.find('#');
    std::string base = link.substr(0, hash);
    std::string fragment = (hash == std::string::npos) ? std::string() : link.substr(hash);

    if (base.find('?') == std::string::npos) {
        base.push_back('?');
    } else if (base.back() != '?' && base.back() != '&') {
        base.push_back('&');
    }
    return base + extra + fragment;
}

QueryParams ParseQuery(std::string_view raw_query) {
    QueryParams params;
    if (!raw_query.empty() && raw_query.front() == '?') raw_query.remove_prefix(1);

    while (!raw_query.empty()) {
        auto amp = raw_query.find('&');
        std::string_view piece = raw_query.substr(0, amp);
        raw_query = (amp == std::string_view::npos) ? std::string_view() : raw_query.substr(amp + 1);
        if (piece.empty()) continue;

        auto eq = piece.find('=');
        std::string_view key = piece.substr(0, eq);
        std::string_view value = (eq == std::string_view::npos) ? std::string_view() : piece.substr(eq + 1);
        params.emplace_back(PercentDecode(key, true), PercentDecode(value, true));
    }
    return params;
}

std::optional<std::string> QueryValue(const QueryParams& query, const std::string& key) {
    for (const auto& [k, v] : query) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::string PercentDecode(std::string_view s, bool plus_as_space) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string UrlEncodeAll(std::string_view s) {
    auto is_unreserved = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::optional<std::string> ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    CurlUrlPtr h(curl_url());
    if (!h) return std::nullopt;
    if (curl_url_set(h.get(), CURLUPART_URL, base_url.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    // With a base already set, a relative reference is resolved against it.
    if (curl_url_set(h.get(), CURLUPART_URL, candidate.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return std::nullopt;
    }
    std::string resolved = GetPart(h.get(), CURLUPART_URL);
    if (resolved.empty()) return std::nullopt;
    return resolved;
}

std::string ReferenceScheme(std::string_view reference) {
    std::string cleaned;
    cleaned.reserve(reference.size());
    for (unsigned char c : reference) {
        if (c <= 0x20 || c == 0x7F) continue;
        cleaned.push_back(static_cast<char>(c));
    }

    auto colon = cleaned.find(':');
    if (colon == std::string::npos || colon == 0) return "";
    auto delim = cleaned.find_first_of("/?#");
    if (delim != std::string::npos && delim < colon) return "";
    if (!is_ascii_alpha(cleaned[0])) return "";

    std::string scheme;
    for (size_t i = 0; i < colon; ++i) {
        char c = cleaned[i];
        bool valid = is_ascii_alpha(c) || (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
        if (!valid) return "";
        scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return scheme;
}

}
}
