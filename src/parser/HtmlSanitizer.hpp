#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "HtmlDocument.hpp"

namespace ReadServe {

// Allowlist HTML serializer for untrusted markup.
//
// - script-like, embedding and page-chrome elements are dropped together with their content
// - unknown elements are unwrapped (children kept)
// - only allowlisted attributes survive; event handlers and style never do
// - URL attributes must be http, https, mailto or relative; relative ones are resolved against base_url
// - links get rel="nofollow noopener noreferrer"
class HtmlSanitizer {
public:
    static std::string Sanitize(const std::string& html_content, const std::string& base_url);
    // Serializes the children of root (root itself is not emitted).
    static std::string SanitizeChildren(lxb_dom_node_t* root, const std::string& base_url);

    static std::string EscapeText(std::string_view s);
    static std::string EscapeAttribute(std::string_view s);

    // Returns the value to emit for a URL attribute, or std::nullopt to drop it.
    static std::optional<std::string> SafeUrl(const std::string& value, const std::string& base_url);

    static bool HasVisibleContent(const std::string& sanitized_html);
};

}
