/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器，提供异常安全的文件管理
 */

#pragma once

#include <memory>
#include <cstdio>
#include <string>
#include "excelpic/core/Exception.hpp"
#include "excelpic/core/Path.hpp"

namespace excelpic {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 打开失败、读写失败均抛出 core::FileException，文件句柄在析构时自动关闭。
 */
class FileWrapper {
public:
    enum class Mode {
        Read,
        Write
    };

    /**
     * @brief 以二进制模式打开文件
     * @throws core::FileException 文件打开失败时（读模式为 FileNotFound，写模式为 FileWriteError）
     */
    FileWrapper(const core::Path& path, Mode mode);

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    /**
     * @brief 读取至多 max_bytes 字节
     */
    std::string read(size_t max_bytes);

    /**
     * @brief 读取剩余的全部内容
     */
    std::string readAll();

    void write(const std::string& content);

    /**
     * @brief 显式关闭并检查错误
     */
    void close();

    bool isOpen() const { return file_ != nullptr; }

    static std::string readFile(const core::Path& path);
    static std::string readPrefix(const core::Path& path, size_t max_bytes);
    static void writeFile(const core::Path& path, const std::string& content);

private:
    struct FileCloser {
        void operator()(FILE* file) const noexcept {
            if (file) {
                std::fclose(file);
            }
        }
    };

    std::unique_ptr<FILE, FileCloser> file_;
    core::Path path_;
};

} // namespace utils
} // namespace excelpic
