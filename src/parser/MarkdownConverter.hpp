#pragma once
#include <string>

namespace ReadServe {

// Converts sanitized HTML into Markdown with html2md.
// The result has no leading or trailing blank lines and ends with a single newline unless empty.
class MarkdownConverter {
public:
    static std::string Convert(const std::string& html_content);
};

}
