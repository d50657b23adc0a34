#pragma once
#include <string>

namespace ReadServe {

// Page template with a {{Title}} and a {{Content}} placeholder, parsed once.
class HtmlTemplate {
public:
    static const char* const kDefaultSource;

    // Throws std::invalid_argument unless {{Title}} appears once, followed by {{Content}}.
    explicit HtmlTemplate(const std::string& source = kDefaultSource);

    // The title is HTML-escaped; content is inserted verbatim and must already be sanitized.
    std::string Render(const std::string& title, const std::string& content) const;

private:
    std::string head_;
    std::string middle_;
    std::string tail_;
};

}
