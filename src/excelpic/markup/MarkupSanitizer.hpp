#pragma once

#include "excelpic/core/Path.hpp"
#include <cstddef>
#include <string>

namespace excelpic {
namespace markup {

/**
 * @brief 发布出的HTML在渲染前的文本清理
 *
 * 三个操作互相独立，都直接修改磁盘上的文件。
 * 文件读写失败抛出 core::FileException，不做静默恢复。
 */
class MarkupSanitizer {
public:
    /// 字符集探测只检查文件开头的字节数
    static constexpr size_t kCharsetScanLimit = 2048;

    static const char* const kDefaultCharset;

    /// 注入的样式：去掉body外边距，宽高自适应，表格占满宽度
    static const char* const kBorderlessCss;

    /**
     * @brief 从文件前2048字节中查找 <meta ... charset=...> 声明
     * @return 声明的字符集，未找到返回 "utf-8"
     */
    static std::string extractCharset(const core::Path& html_path);

    /**
     * @brief 删除文件中所有的 U+FFFD 替换字符
     *
     * UTF-8 文件中的非法字节序列同样被删除。单字节字符集无法表示
     * U+FFFD，文件保持不变。重复执行结果相同。
     */
    static void cleanInvalidCharacters(const core::Path& html_path, const std::string& charset);

    /**
     * @brief 注入去边框样式
     *
     * 已有 <style> 块时追加到第一个块的末尾；否则在第一个 </head>
     * 之前插入新的 <style> 块。只修改一处。
     */
    static void removeBorders(const core::Path& html_path, const std::string& charset);

    /**
     * @brief 依次执行三个操作
     * @return 探测到的字符集
     */
    static std::string sanitize(const core::Path& html_path);

    // 纯文本版本，便于单独测试
    static std::string extractCharsetFromBytes(const std::string& head);
    static std::string stripReplacementCharacters(const std::string& content, const std::string& charset);
    static std::string injectBorderlessCss(const std::string& content);

    static bool isUtf8Charset(const std::string& charset);
};

}} // namespace excelpic::markup
