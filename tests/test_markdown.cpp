#include <catch2/catch_all.hpp>
#include "parser/MarkdownConverter.hpp"

using namespace ReadServe;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("MarkdownConverter renders headings and emphasis") {
    std::string md = MarkdownConverter::Convert("<h1>Title</h1><p>Hello <strong>bold</strong> words.</p><h3>Sub</h3>");
    CHECK_THAT(md, ContainsSubstring("# Title"));
    CHECK_THAT(md, ContainsSubstring("### Sub"));
    CHECK_THAT(md, ContainsSubstring("**bold**"));
    CHECK_THAT(md, !ContainsSubstring("<strong>"));
    CHECK_THAT(md, !ContainsSubstring("<h1>"));
}

TEST_CASE("MarkdownConverter renders links") {
    std::string md = MarkdownConverter::Convert(R"(<p>See <a href="https://example.com/page">the site</a> today.</p>)");
    CHECK_THAT(md, ContainsSubstring("[the site]("));
    CHECK_THAT(md, ContainsSubstring("https://example.com/page"));
    CHECK_THAT(md, !ContainsSubstring("<a "));
}

TEST_CASE("MarkdownConverter renders lists") {
    std::string md = MarkdownConverter::Convert("<ul><li>One</li><li>Two</li></ul>");
    CHECK_THAT(md, ContainsSubstring("One"));
    CHECK_THAT(md, ContainsSubstring("Two"));
    CHECK(md.find("One") < md.find("Two"));
    CHECK_THAT(md, !ContainsSubstring("<li>"));
}

TEST_CASE("MarkdownConverter renders code") {
    std::string md = MarkdownConverter::Convert("<p>Call <code>run_it()</code> first.</p><pre><code>int main() {\n    return 0;\n}\n</code></pre>");
    CHECK_THAT(md, ContainsSubstring("`run_it()`"));
    CHECK_THAT(md, ContainsSubstring("return 0;"));
    CHECK_THAT(md, !ContainsSubstring("<pre>"));
}

TEST_CASE("MarkdownConverter renders blockquotes") {
    std::string md = MarkdownConverter::Convert("<blockquote><p>Quoted</p></blockquote><p>After</p>");
    CHECK_THAT(md, ContainsSubstring("> "));
    CHECK_THAT(md, ContainsSubstring("Quoted"));
    CHECK_THAT(md, ContainsSubstring("After"));
}

TEST_CASE("MarkdownConverter trims surrounding blank lines") {
    std::string md = MarkdownConverter::Convert("<p>Hello <strong>world</strong></p>");
    REQUIRE_FALSE(md.empty());
    CHECK(md.back() == '\n');
    CHECK(md.front() != '\n');
    CHECK(md.find("\n\n", md.size() - 2) == std::string::npos);
}

TEST_CASE("MarkdownConverter returns nothing for empty input") {
    CHECK(MarkdownConverter::Convert("").empty());
    CHECK(MarkdownConverter::Convert("<p>   </p>").empty());
}
