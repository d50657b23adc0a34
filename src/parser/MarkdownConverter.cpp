#include "MarkdownConverter.hpp"
#include <html2md.h>

namespace ReadServe {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}

std::string MarkdownConverter::Convert(const std::string& html_content) {
    std::string html = html_content;
    std::string markdown = html2md::Convert(html);

    size_t begin = 0;
    while (begin < markdown.size() && IsSpace(markdown[begin])) ++begin;
    size_t end = markdown.size();
    while (end > begin && IsSpace(markdown[end - 1])) --end;
    if (begin == end) return "";
    return markdown.substr(begin, end - begin) + "\n";
}

}
