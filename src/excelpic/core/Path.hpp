#pragma once

#include <string>
#include <cstdio>
#include <cstdint>
#include <ostream>

namespace excelpic {
namespace core {

/**
 * @brief UTF-8路径处理类，封装跨平台文件路径操作
 *
 * Windows下通过utf8cpp转换为UTF-16（COM的BSTR参数、CreateProcessW、
 * _wfopen都需要宽字符路径），其他平台直接使用UTF-8。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);

    Path() = default;
    Path(const Path& other) = default;
    Path(Path&& other) noexcept = default;
    Path& operator=(const Path& other) = default;
    Path& operator=(Path&& other) noexcept = default;
    ~Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 路径运算
    /**
     * @brief 转换为绝对路径（自动化宿主要求绝对路径）
     */
    Path absolute() const;

    Path parent() const;

    /**
     * @brief 文件名部分（不含目录）
     */
    std::string filename() const;

    Path operator/(const std::string& child) const;

    // 文件操作
    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;

    /**
     * @brief 获取文件大小
     * @return 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;

    /**
     * @brief 删除文件
     * @return 是否删除成功
     */
    bool remove() const;

    /**
     * @brief 递归创建目录，已存在时直接返回true
     */
    bool createDirectories() const;

    FILE* openForRead(bool binary = true) const;
    FILE* openForWrite(bool binary = true) const;

    /**
     * @brief 当前可执行文件所在目录，失败时返回当前工作目录
     */
    static Path executableDirectory();

#ifdef _WIN32
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace excelpic
