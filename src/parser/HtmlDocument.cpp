#include "HtmlDocument.hpp"
#include <cstring>

namespace {

std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

// Pre-order walk over first_child/next/parent links; no recursion, so nesting depth is unbounded.
void AppendText(lxb_dom_node_t* root, std::string& out) {
    lxb_dom_node_t* node = root->first_child;
    while (node != nullptr && node != root) {
        if (ReadServe::Dom::IsText(node)) {
            out += ReadServe::Dom::Text(node);
        } else if (ReadServe::Dom::IsElement(node) && node->first_child != nullptr) {
            node = node->first_child;
            continue;
        }
        while (node != root && node->next == nullptr) {
            node = node->parent;
        }
        if (node == root) break;
        node = node->next;
    }
}

} // anonymous namespace

namespace ReadServe {

std::unique_ptr<HtmlDocument> HtmlDocument::Parse(const std::string& html_content) {
    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) return nullptr;

    lxb_status_t status = lxb_html_document_parse(document,
        reinterpret_cast<const lxb_char_t*>(html_content.c_str()),
        html_content.length());

    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        return nullptr;
    }
    return std::unique_ptr<HtmlDocument>(new HtmlDocument(document));
}

HtmlDocument::~HtmlDocument() {
    lxb_html_document_destroy(document_);
}

lxb_dom_node_t* HtmlDocument::Body() const {
    auto* body = lxb_html_document_body_element(document_);
    return body ? lxb_dom_interface_node(body) : nullptr;
}

lxb_dom_element_t* HtmlDocument::Head() const {
    auto* head = lxb_html_document_head_element(document_);
    return head ? lxb_dom_interface_element(head) : nullptr;
}

std::string HtmlDocument::Title() const {
    size_t len = 0;
    const lxb_char_t* t = lxb_html_document_title(document_, &len);
    return to_std_string(t, len);
}

namespace Dom {

bool IsElement(const lxb_dom_node_t* node) {
    return node != nullptr && node->type == LXB_DOM_NODE_TYPE_ELEMENT;
}

bool IsText(const lxb_dom_node_t* node) {
    return node != nullptr && node->type == LXB_DOM_NODE_TYPE_TEXT;
}

std::string TagName(lxb_dom_node_t* node) {
    if (!IsElement(node)) return "";
    size_t len = 0;
    const lxb_char_t* name = lxb_dom_element_local_name(lxb_dom_interface_element(node), &len);
    return to_std_string(name, len);
}

std::string Attribute(lxb_dom_node_t* node, const char* name) {
    if (!IsElement(node)) return "";
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(lxb_dom_interface_element(node),
        reinterpret_cast<const lxb_char_t*>(name), std::strlen(name), &len);
    return to_std_string(value, len);
}

std::string Text(lxb_dom_node_t* node) {
    if (!IsText(node)) return "";
    const lexbor_str_t& data = lxb_dom_interface_text(node)->char_data.data;
    return to_std_string(data.data, data.length);
}

std::string TextContent(lxb_dom_node_t* node) {
    std::string out;
    if (IsText(node)) return Text(node);
    if (node) AppendText(node, out);
    return out;
}

}
}
