#pragma once

#include <optional>
#include <string>

namespace excelpic {
namespace utils {

/**
 * @brief 临时文件名生成器
 *
 * 随机生成128位UUID，取其SHA-256十六进制摘要作为文件名主体。
 * 多个进程共享同一临时目录时冲突概率可以忽略。
 */
class FileNameGenerator {
public:
    /**
     * @brief 生成文件名
     * @param extension 扩展名，不含点（html、png等）
     * @param modifier 可选后缀，放在扩展名之前
     * @return "<64位十六进制><modifier>.<extension>"
     *
     * @example
     * generateHashedFilename("html");          // "3f9c...e1.html"
     * generateHashedFilename("html", "_tmp");  // "a07d...4b_tmp.html"
     */
    static std::string generateHashedFilename(const std::string& extension,
                                              const std::optional<std::string>& modifier = std::nullopt);

    /**
     * @brief 生成随机的版本4 UUID字符串（小写，带连字符）
     */
    static std::string randomUuid();
};

}} // namespace excelpic::utils
