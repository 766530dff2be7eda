#include <gtest/gtest.h>
#include "excelpic/core/Exception.hpp"
#include "excelpic/markup/MarkupSanitizer.hpp"
#include "excelpic/utils/FileWrapper.hpp"
#include "../support/TempDirectory.hpp"

using excelpic::core::Path;
using excelpic::markup::MarkupSanitizer;
using excelpic::utils::FileWrapper;

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

class MarkupSanitizerTest : public ::testing::Test {
protected:
    Path writeHtml(const std::string& name, const std::string& content) {
        Path path(temp.file(name));
        FileWrapper::writeFile(path, content);
        return path;
    }

    excelpic::test::TempDirectory temp;
};

// 测试字符集探测
TEST_F(MarkupSanitizerTest, DetectsDeclaredCharsetInAnyCase) {
    Path path = writeHtml("latin.html",
                          "<html><head><META HTTP-EQUIV=\"Content-Type\" CONTENT=\"text/html; "
                          "CHARSET=\"ISO-8859-1\"></head><body></body></html>");
    EXPECT_EQ(MarkupSanitizer::extractCharset(path), "ISO-8859-1");

    Path lower = writeHtml("lower.html", "<meta charset='windows-1252'>");
    EXPECT_EQ(MarkupSanitizer::extractCharset(lower), "windows-1252");
}

TEST_F(MarkupSanitizerTest, DefaultsToUtf8WithoutDeclaration) {
    Path path = writeHtml("plain.html", "<html><head><title>t</title></head></html>");
    EXPECT_EQ(MarkupSanitizer::extractCharset(path), "utf-8");
}

// 只检查前2048字节
TEST_F(MarkupSanitizerTest, IgnoresDeclarationPastScanLimit) {
    std::string content = "<html><head>";
    content += std::string(MarkupSanitizer::kCharsetScanLimit, ' ');
    content += "<meta charset=\"ISO-8859-1\"></head></html>";
    Path path = writeHtml("late.html", content);
    EXPECT_EQ(MarkupSanitizer::extractCharset(path), "utf-8");
}

TEST_F(MarkupSanitizerTest, MissingFileThrows) {
    Path missing(temp.file("missing.html"));
    EXPECT_THROW(MarkupSanitizer::extractCharset(missing), excelpic::core::FileException);
    EXPECT_THROW(MarkupSanitizer::removeBorders(missing, "utf-8"), excelpic::core::FileException);
}

// 测试删除替换字符
TEST_F(MarkupSanitizerTest, RemovesReplacementCharacters) {
    Path path = writeHtml("bad.html", "<td>A\xEF\xBF\xBD" "B\xEF\xBF\xBD</td>");
    MarkupSanitizer::cleanInvalidCharacters(path, "utf-8");
    EXPECT_EQ(FileWrapper::readFile(path), "<td>AB</td>");
}

TEST_F(MarkupSanitizerTest, RemovesInvalidUtf8Sequences) {
    Path path = writeHtml("invalid.html", "<td>\xC3\xA9t\xE9" "\xFF</td>");
    MarkupSanitizer::cleanInvalidCharacters(path, "UTF8");
    EXPECT_EQ(FileWrapper::readFile(path), "<td>\xC3\xA9t</td>");
}

TEST_F(MarkupSanitizerTest, CleaningIsIdempotent) {
    Path path = writeHtml("twice.html", "<p>x\xEF\xBF\xBDy\x80z \xE4\xB8\xAD</p>");
    MarkupSanitizer::cleanInvalidCharacters(path, "utf-8");
    std::string once = FileWrapper::readFile(path);
    MarkupSanitizer::cleanInvalidCharacters(path, "utf-8");
    EXPECT_EQ(FileWrapper::readFile(path), once);
    EXPECT_EQ(once, "<p>xyz \xE4\xB8\xAD</p>");
}

// 单字节字符集无法表示U+FFFD，内容不变
TEST_F(MarkupSanitizerTest, LegacyCharsetLeftUnchanged) {
    const std::string content = "<td>caf\xE9</td>";
    Path path = writeHtml("legacy.html", content);
    MarkupSanitizer::cleanInvalidCharacters(path, "windows-1252");
    EXPECT_EQ(FileWrapper::readFile(path), content);
}

// 测试去边框样式注入
TEST_F(MarkupSanitizerTest, AppendsIntoFirstStyleBlockOnly) {
    const std::string content =
        "<html><head><style type=\"text/css\">td { color: red; }</style>"
        "<style>th { color: blue; }</style></head><body></body></html>";
    std::string result = MarkupSanitizer::injectBorderlessCss(content);

    EXPECT_EQ(countOccurrences(result, "<style"), 2u);
    EXPECT_EQ(countOccurrences(result, "margin: 0;"), 1u);

    size_t css = result.find("margin: 0;");
    size_t first_close = result.find("</style>");
    size_t second_open = result.find("<style>");
    EXPECT_LT(result.find("td { color: red; }"), css);
    EXPECT_LT(css, first_close);
    EXPECT_LT(first_close, second_open);
    EXPECT_NE(result.find("<style>th { color: blue; }</style>"), std::string::npos);
}

TEST_F(MarkupSanitizerTest, InsertsStyleBeforeHeadClose) {
    const std::string content = "<html><head><title>t</title></HEAD><body></body></html>";
    std::string result = MarkupSanitizer::injectBorderlessCss(content);

    EXPECT_EQ(countOccurrences(result, "<style>"), 1u);
    size_t style_close = result.find("</style>\n");
    ASSERT_NE(style_close, std::string::npos);
    EXPECT_EQ(style_close + std::string("</style>\n").size(), result.find("</HEAD>"));
    EXPECT_NE(result.find("width: 100%;"), std::string::npos);
}

TEST_F(MarkupSanitizerTest, NoHeadOrStyleLeavesContentUnchanged) {
    const std::string content = "<table><tr><td>1</td></tr></table>";
    EXPECT_EQ(MarkupSanitizer::injectBorderlessCss(content), content);
}

TEST_F(MarkupSanitizerTest, RemoveBordersRewritesFile) {
    Path path = writeHtml("style.html", "<head><style>p{}</style></head>");
    MarkupSanitizer::removeBorders(path, "utf-8");
    std::string result = FileWrapper::readFile(path);
    EXPECT_EQ(result, std::string("<head><style>p{}") + MarkupSanitizer::kBorderlessCss + "</style></head>");
}

// 测试完整清理流程
TEST_F(MarkupSanitizerTest, SanitizeRunsAllSteps) {
    Path path = writeHtml("full.html",
                          "<html><head><meta charset=\"utf-8\"></head>"
                          "<body>a\xEF\xBF\xBD" "b</body></html>");
    EXPECT_EQ(MarkupSanitizer::sanitize(path), "utf-8");

    std::string result = FileWrapper::readFile(path);
    EXPECT_NE(result.find("<body>ab</body>"), std::string::npos);
    EXPECT_NE(result.find("margin: 0;"), std::string::npos);
    EXPECT_LT(result.find("margin: 0;"), result.find("</head>"));
}
