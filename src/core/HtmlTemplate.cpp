#include "HtmlTemplate.hpp"
#include <stdexcept>
#include "../parser/HtmlSanitizer.hpp"

namespace {

constexpr const char* kTitlePlaceholder = "{{Title}}";
constexpr const char* kContentPlaceholder = "{{Content}}";

}

namespace ReadServe {

const char* const HtmlTemplate::kDefaultSource = R"(
<!DOCTYPE html>
<html>
<head>
	<meta charset="utf-8"/>
	<meta name="viewport" content="width=device-width, initial-scale=1.0">
	<link id="theme" rel="stylesheet" href="https://unpkg.com/sakura.css/css/sakura.css">
</head>
<body>
	<script src="https://bookmarklet-theme.vercel.app/script.js"></script>
	<h1>{{Title}}</h1>
	{{Content}}
</body>
</html>
)";

HtmlTemplate::HtmlTemplate(const std::string& source) {
    const std::string title(kTitlePlaceholder);
    const std::string content(kContentPlaceholder);

    auto title_pos = source.find(title);
    if (title_pos == std::string::npos || source.find(title, title_pos + 1) != std::string::npos) {
        throw std::invalid_argument("HTML template must contain exactly one {{Title}} placeholder");
    }
    auto content_pos = source.find(content, title_pos + title.size());
    if (content_pos == std::string::npos || source.find(content, content_pos + 1) != std::string::npos ||
        source.find(content) != content_pos) {
        throw std::invalid_argument("HTML template must contain exactly one {{Content}} placeholder after {{Title}}");
    }

    head_ = source.substr(0, title_pos);
    middle_ = source.substr(title_pos + title.size(), content_pos - title_pos - title.size());
    tail_ = source.substr(content_pos + content.size());
}

std::string HtmlTemplate::Render(const std::string& title, const std::string& content) const {
    std::string out;
    out.reserve(head_.size() + middle_.size() + tail_.size() + title.size() + content.size());
    out += head_;
    out += HtmlSanitizer::EscapeAttribute(title);
    out += middle_;
    out += content;
    out += tail_;
    return out;
}

}
