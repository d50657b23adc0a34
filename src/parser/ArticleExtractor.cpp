#include "ArticleExtractor.hpp"
#include <algorithm>
#include <functional>
#include <unordered_map>
#include <vector>
#include "HtmlSanitizer.hpp"

namespace {

constexpr int kMaxDepth = 256;
// Paragraphs shorter than this are usually captions, bylines or buttons.
constexpr size_t kMinParagraphLength = 25;

std::string TrimSpace(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// ASCII lowercase helper
static inline void ascii_tolower_inplace(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
}

lxb_dom_node_t* FindFirst(lxb_dom_node_t* node, const std::function<bool(lxb_dom_node_t*)>& match, int depth = 0) {
    if (depth > kMaxDepth) return nullptr;
    for (lxb_dom_node_t* child = node->first_child; child != nullptr; child = child->next) {
        if (!ReadServe::Dom::IsElement(child)) continue;
        if (match(child)) return child;
        if (auto* found = FindFirst(child, match, depth + 1)) return found;
    }
    return nullptr;
}

void CollectParagraphs(lxb_dom_node_t* node, std::vector<lxb_dom_node_t*>& out, int depth = 0) {
    if (depth > kMaxDepth) return;
    for (lxb_dom_node_t* child = node->first_child; child != nullptr; child = child->next) {
        if (!ReadServe::Dom::IsElement(child)) continue;
        if (ReadServe::Dom::TagName(child) == "p") {
            out.push_back(child);
        } else {
            CollectParagraphs(child, out, depth + 1);
        }
    }
}

lxb_dom_node_t* BestScoredContainer(lxb_dom_node_t* body) {
    std::vector<lxb_dom_node_t*> paragraphs;
    CollectParagraphs(body, paragraphs);

    std::unordered_map<lxb_dom_node_t*, size_t> scores;
    for (auto* p : paragraphs) {
        size_t len = TrimSpace(ReadServe::Dom::TextContent(p)).size();
        if (len < kMinParagraphLength) continue;
        lxb_dom_node_t* parent = p->parent;
        if (!ReadServe::Dom::IsElement(parent)) continue;
        scores[parent] += len * 2;
        if (parent != body && ReadServe::Dom::IsElement(parent->parent)) {
            scores[parent->parent] += len;
        }
    }

    lxb_dom_node_t* best = nullptr;
    size_t best_score = 0;
    for (const auto& [node, score] : scores) {
        if (score > best_score) {
            best = node;
            best_score = score;
        }
    }
    return best;
}

// og:title / twitter:title, scanned in <head>
std::string MetaTitle(const ReadServe::HtmlDocument& document) {
    std::string title;
    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document.Get());
    lxb_dom_collection_t* col = lxb_dom_collection_make(dom_doc, 32);
    if (col == nullptr) return title;

    lxb_dom_element_t* head_el = document.Head();
    if (head_el != nullptr) {
        (void) lxb_dom_elements_by_tag_name(head_el, col, reinterpret_cast<const lxb_char_t*>("meta"), 4);
    }

    std::string twitter_title;
    const size_t count = lxb_dom_collection_length(col);
    for (size_t i = 0; i < count; ++i) {
        lxb_dom_element_t* el = lxb_dom_collection_element(col, i);
        if (!el) continue;
        lxb_dom_node_t* node = lxb_dom_interface_node(el);

        std::string prop = ReadServe::Dom::Attribute(node, "property");
        if (prop.empty()) prop = ReadServe::Dom::Attribute(node, "name");
        std::string content = TrimSpace(ReadServe::Dom::Attribute(node, "content"));
        if (prop.empty() || content.empty()) continue;
        ascii_tolower_inplace(prop);

        if (prop == "og:title" && title.empty()) title = content;
        else if (prop == "twitter:title" && twitter_title.empty()) twitter_title = content;
    }
    lxb_dom_collection_destroy(col, true);

    return title.empty() ? twitter_title : title;
}

} // anonymous namespace

namespace ReadServe {

lxb_dom_node_t* ArticleExtractor::FindContentRoot(const HtmlDocument& document) {
    lxb_dom_node_t* body = document.Body();
    if (!body) return nullptr;

    if (auto* article = FindFirst(body, [](lxb_dom_node_t* n) { return Dom::TagName(n) == "article"; })) {
        return article;
    }
    if (auto* role_main = FindFirst(body, [](lxb_dom_node_t* n) {
            std::string role = Dom::Attribute(n, "role");
            ascii_tolower_inplace(role);
            return TrimSpace(role) == "main";
        })) {
        return role_main;
    }
    if (auto* main_el = FindFirst(body, [](lxb_dom_node_t* n) { return Dom::TagName(n) == "main"; })) {
        return main_el;
    }
    if (auto* scored = BestScoredContainer(body)) {
        return scored;
    }
    return body;
}

ExtractResult ArticleExtractor::Extract(const std::string& html_content, const std::string& source_url) {
    ExtractResult result;

    auto document = HtmlDocument::Parse(html_content);
    if (!document) {
        result.error = "failed to parse HTML document";
        return result;
    }

    Article article;
    article.title = TrimSpace(document->Title());
    if (article.title.empty()) {
        article.title = MetaTitle(*document);
    }

    lxb_dom_node_t* root = FindContentRoot(*document);
    article.content = HtmlSanitizer::SanitizeChildren(root, source_url);

    if (article.title.empty() && !HtmlSanitizer::HasVisibleContent(article.content)) {
        result.error = "no readable content";
        return result;
    }

    result.article = std::move(article);
    return result;
}

}
