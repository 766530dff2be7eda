#include "excelpic/markup/MarkupSanitizer.hpp"
#include "excelpic/utils/FileWrapper.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <utf8.h>

namespace excelpic {
namespace markup {

const char* const MarkupSanitizer::kDefaultCharset = "utf-8";

const char* const MarkupSanitizer::kBorderlessCss = R"(
        body {
            margin: 0;
            width: auto;
            height: auto;
        }
        table {
            width: 100%;
        }
    )";

namespace {

// U+FFFD 的UTF-8编码
const std::string kReplacementCharUtf8 = "\xEF\xBF\xBD";

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

bool MarkupSanitizer::isUtf8Charset(const std::string& charset) {
    const std::string lower = toLowerAscii(charset);
    return lower == "utf-8" || lower == "utf8";
}

std::string MarkupSanitizer::extractCharsetFromBytes(const std::string& head) {
    static const std::regex charset_regex(R"(<meta.*?charset=["']*(.+?)["'>])",
                                          std::regex::ECMAScript | std::regex::icase);
    std::smatch match;
    if (!std::regex_search(head, match, charset_regex)) {
        return kDefaultCharset;
    }

    // 只保留ASCII字符
    std::string charset;
    for (char c : match[1].str()) {
        if (static_cast<unsigned char>(c) < 0x80) {
            charset += c;
        }
    }
    return charset.empty() ? std::string(kDefaultCharset) : charset;
}

std::string MarkupSanitizer::extractCharset(const core::Path& html_path) {
    std::string head = utils::FileWrapper::readPrefix(html_path, kCharsetScanLimit);
    std::string charset = extractCharsetFromBytes(head);
    MARKUP_DEBUG("Charset of {}: {}", html_path.string(), charset);
    return charset;
}

std::string MarkupSanitizer::stripReplacementCharacters(const std::string& content,
                                                        const std::string& charset) {
    if (!isUtf8Charset(charset)) {
        return content;
    }

    // 先把非法序列统一替换为U+FFFD，再整体删除
    std::string repaired;
    repaired.reserve(content.size());
    utf8::replace_invalid(content.begin(), content.end(), std::back_inserter(repaired), 0xFFFD);

    std::string cleaned;
    cleaned.reserve(repaired.size());
    size_t pos = 0;
    while (true) {
        size_t found = repaired.find(kReplacementCharUtf8, pos);
        if (found == std::string::npos) {
            cleaned.append(repaired, pos, std::string::npos);
            break;
        }
        cleaned.append(repaired, pos, found - pos);
        pos = found + kReplacementCharUtf8.size();
    }
    return cleaned;
}

void MarkupSanitizer::cleanInvalidCharacters(const core::Path& html_path, const std::string& charset) {
    if (!isUtf8Charset(charset)) {
        MARKUP_DEBUG("Charset {} cannot carry U+FFFD, {} left unchanged", charset, html_path.string());
        return;
    }

    std::string content = utils::FileWrapper::readFile(html_path);
    std::string cleaned = stripReplacementCharacters(content, charset);
    if (cleaned.size() != content.size()) {
        MARKUP_DEBUG("Removed {} bytes of invalid characters from {}",
                     content.size() - cleaned.size(), html_path.string());
    }
    utils::FileWrapper::writeFile(html_path, cleaned);
}

std::string MarkupSanitizer::injectBorderlessCss(const std::string& content) {
    // 查找第一个完整的 <style ...>...</style> 块
    size_t search_from = 0;
    while (true) {
        size_t open = content.find("<style", search_from);
        if (open == std::string::npos) {
            break;
        }
        size_t open_end = content.find('>', open);
        if (open_end == std::string::npos) {
            break;
        }
        size_t close = content.find("</style>", open_end + 1);
        if (close != std::string::npos) {
            std::string result;
            result.reserve(content.size() + std::char_traits<char>::length(kBorderlessCss));
            result.append(content, 0, close);
            result.append(kBorderlessCss);
            result.append(content, close, std::string::npos);
            return result;
        }
        search_from = open + 1;
    }

    // 没有样式块：在 </head> 前插入
    const std::string lower = toLowerAscii(content);
    size_t head_close = lower.find("</head>");
    if (head_close == std::string::npos) {
        MARKUP_WARN("No <style> block or </head> tag found, CSS not injected");
        return content;
    }

    std::string result;
    result.reserve(content.size() + 32 + std::char_traits<char>::length(kBorderlessCss));
    result.append(content, 0, head_close);
    result.append("<style>");
    result.append(kBorderlessCss);
    result.append("</style>\n");
    result.append(content, head_close, std::string::npos);
    return result;
}

void MarkupSanitizer::removeBorders(const core::Path& html_path, const std::string& charset) {
    MARKUP_DEBUG("Injecting borderless CSS into {} ({})", html_path.string(), charset);
    std::string content = utils::FileWrapper::readFile(html_path);
    utils::FileWrapper::writeFile(html_path, injectBorderlessCss(content));
}

std::string MarkupSanitizer::sanitize(const core::Path& html_path) {
    std::string charset = extractCharset(html_path);
    cleanInvalidCharacters(html_path, charset);
    removeBorders(html_path, charset);
    return charset;
}

}} // namespace excelpic::markup
