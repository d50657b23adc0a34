#include "HtmlSanitizer.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "../utils/UrlUtil.hpp"

namespace {

// Deeper subtrees are not emitted.
constexpr int kMaxDepth = 256;

const std::unordered_set<std::string>& DroppedTags() {
    static const std::unordered_set<std::string> tags = {
        "script", "style", "noscript", "iframe", "object", "embed", "template", "svg", "math",
        "canvas", "form", "input", "button", "select", "textarea", "nav", "footer", "aside",
        "header", "link", "meta", "base", "frame", "frameset", "applet", "head", "title",
        "audio", "video", "source", "track", "dialog", "portal"
    };
    return tags;
}

const std::unordered_set<std::string>& AllowedTags() {
    static const std::unordered_set<std::string> tags = {
        "p", "br", "hr", "h1", "h2", "h3", "h4", "h5", "h6", "div", "section", "span",
        "strong", "b", "em", "i", "u", "s", "del", "ins", "mark", "small", "sub", "sup",
        "code", "pre", "kbd", "samp", "var", "blockquote", "q", "cite", "abbr", "time",
        "a", "img", "ul", "ol", "li", "dl", "dt", "dd", "figure", "figcaption",
        "table", "caption", "thead", "tbody", "tfoot", "tr", "th", "td"
    };
    return tags;
}

const std::unordered_map<std::string, std::vector<const char*>>& TagAttributes() {
    static const std::unordered_map<std::string, std::vector<const char*>> attrs = {
        {"a", {"href"}},
        {"img", {"src", "alt", "width", "height"}},
        {"td", {"colspan", "rowspan"}},
        {"th", {"colspan", "rowspan"}},
        {"time", {"datetime"}},
        {"blockquote", {"cite"}},
        {"q", {"cite"}},
        {"ol", {"start"}}
    };
    return attrs;
}

const char* const kGlobalAttributes[] = {"title", "lang", "dir"};

bool IsUrlAttribute(const std::string& name) {
    return name == "href" || name == "src" || name == "cite";
}

bool IsVoidTag(const std::string& tag) {
    return tag == "br" || tag == "hr" || tag == "img";
}

bool IsDigits(const std::string& s) {
    return !s.empty() && s.size() <= 6 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
}

void AppendAttribute(std::string& out, const char* name, const std::string& value) {
    out.push_back(' ');
    out += name;
    out += "=\"";
    out += ReadServe::HtmlSanitizer::EscapeAttribute(value);
    out.push_back('"');
}

void Serialize(lxb_dom_node_t* node, const std::string& base_url, std::string& out, int depth);

void SerializeChildren(lxb_dom_node_t* node, const std::string& base_url, std::string& out, int depth) {
    if (depth > kMaxDepth) return;
    for (lxb_dom_node_t* child = node->first_child; child != nullptr; child = child->next) {
        Serialize(child, base_url, out, depth + 1);
    }
}

void Serialize(lxb_dom_node_t* node, const std::string& base_url, std::string& out, int depth) {
    using namespace ReadServe;

    if (Dom::IsText(node)) {
        out += HtmlSanitizer::EscapeText(Dom::Text(node));
        return;
    }
    if (!Dom::IsElement(node)) return; // comments, processing instructions

    const std::string tag = Dom::TagName(node);
    if (DroppedTags().count(tag)) return;
    if (!AllowedTags().count(tag)) {
        SerializeChildren(node, base_url, out, depth);
        return;
    }

    std::string open = "<" + tag;
    for (const char* name : kGlobalAttributes) {
        std::string value = Dom::Attribute(node, name);
        if (!value.empty()) AppendAttribute(open, name, value);
    }

    bool has_href = false;
    auto it = TagAttributes().find(tag);
    if (it != TagAttributes().end()) {
        for (const char* name : it->second) {
            std::string value = Dom::Attribute(node, name);
            if (value.empty()) continue;
            std::string attr(name);
            if (IsUrlAttribute(attr)) {
                auto safe = HtmlSanitizer::SafeUrl(value, base_url);
                if (!safe) continue;
                value = *safe;
                if (attr == "href") has_href = true;
            } else if (attr != "alt" && attr != "datetime" && !IsDigits(value)) {
                continue; // numeric attributes only
            }
            AppendAttribute(open, name, value);
        }
    }

    // An image without a usable source carries nothing.
    if (tag == "img" && open.find(" src=\"") == std::string::npos) return;

    if (tag == "a" && has_href) {
        open += " rel=\"nofollow noopener noreferrer\"";
    }
    open.push_back('>');
    out += open;

    if (IsVoidTag(tag)) return;

    SerializeChildren(node, base_url, out, depth);
    out += "</" + tag + ">";
}

std::string TrimSpace(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

} // anonymous namespace

namespace ReadServe {

std::string HtmlSanitizer::Sanitize(const std::string& html_content, const std::string& base_url) {
    auto doc = HtmlDocument::Parse(html_content);
    if (!doc || !doc->Body()) return "";
    return SanitizeChildren(doc->Body(), base_url);
}

std::string HtmlSanitizer::SanitizeChildren(lxb_dom_node_t* root, const std::string& base_url) {
    std::string out;
    if (root) SerializeChildren(root, base_url, out, 0);
    return out;
}

std::string HtmlSanitizer::EscapeText(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string HtmlSanitizer::EscapeAttribute(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&#34;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::optional<std::string> HtmlSanitizer::SafeUrl(const std::string& value, const std::string& base_url) {
    std::string trimmed = TrimSpace(value);
    if (trimmed.empty()) return std::nullopt;

    std::string scheme = UrlUtil::ReferenceScheme(trimmed);
    if (scheme == "mailto") return trimmed;
    if (!scheme.empty() && scheme != "http" && scheme != "https") return std::nullopt;
    if (base_url.empty()) return trimmed;

    auto resolved = UrlUtil::ResolveAgainst(base_url, trimmed);
    if (!resolved) {
        return scheme.empty() ? std::nullopt : std::optional<std::string>(trimmed);
    }
    std::string resolved_scheme = UrlUtil::ReferenceScheme(*resolved);
    if (resolved_scheme != "http" && resolved_scheme != "https") return std::nullopt;
    return resolved;
}

bool HtmlSanitizer::HasVisibleContent(const std::string& sanitized_html) {
    bool in_tag = false;
    for (size_t i = 0; i < sanitized_html.size(); ++i) {
        char c = sanitized_html[i];
        if (in_tag) {
            if (c == '>') in_tag = false;
            continue;
        }
        if (c == '<') {
            if (sanitized_html.compare(i, 4, "<img") == 0) return true;
            in_tag = true;
            continue;
        }
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f') return true;
    }
    return false;
}

}
