#pragma once
#include <memory>
#include <string>
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>

namespace ReadServe {

// Owns a parsed lexbor HTML document.
class HtmlDocument {
public:
    // nullptr when lexbor cannot allocate or parse the input.
    static std::unique_ptr<HtmlDocument> Parse(const std::string& html_content);

    ~HtmlDocument();
    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    lxb_html_document_t* Get() const { return document_; }
    lxb_dom_node_t* Body() const;
    lxb_dom_element_t* Head() const;
    std::string Title() const;

private:
    explicit HtmlDocument(lxb_html_document_t* document) : document_(document) {}

    lxb_html_document_t* document_;
};

namespace Dom {

bool IsElement(const lxb_dom_node_t* node);
bool IsText(const lxb_dom_node_t* node);

// Lowercase tag name, "" for non-element nodes.
std::string TagName(lxb_dom_node_t* node);

std::string Attribute(lxb_dom_node_t* node, const char* name);

// Data of a text node.
std::string Text(lxb_dom_node_t* node);

// Concatenated text of every text node below node.
std::string TextContent(lxb_dom_node_t* node);

}
}
