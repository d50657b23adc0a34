#pragma once
#include <string>
#include "../interfaces/IArticleExtractor.hpp"
#include "HtmlDocument.hpp"

namespace ReadServe {

class ArticleExtractor : public IArticleExtractor {
public:
    ExtractResult Extract(const std::string& html_content, const std::string& source_url) override;

    // Element holding the readable body: <article>, [role=main], <main>, the best scored
    // paragraph container, or <body>, in that order.
    static lxb_dom_node_t* FindContentRoot(const HtmlDocument& document);
};

}
