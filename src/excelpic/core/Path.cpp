#include "excelpic/core/Path.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <utf8.h>
#ifdef ERROR
#undef ERROR
#endif
#else
#include <unistd.h>
#include <limits.h>
#endif

namespace excelpic {
namespace core {

namespace {

#ifdef _WIN32
std::filesystem::path toFsPath(const Path& path) {
    return std::filesystem::path(path.getWidePath());
}

std::string fromFsPath(const std::filesystem::path& path) {
    const std::wstring wide = path.wstring();
    std::string result;
    utf8::utf16to8(wide.begin(), wide.end(), std::back_inserter(result));
    return result;
}
#else
std::filesystem::path toFsPath(const Path& path) {
    return std::filesystem::path(path.string());
}

std::string fromFsPath(const std::filesystem::path& path) {
    return path.string();
}
#endif

} // namespace

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : Path(std::string(path ? path : "")) {}

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    if (utf8_path_.empty()) return std::wstring();

    try {
        std::wstring result;
        utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
        return result;
    } catch (const utf8::exception&) {
        // 不是合法UTF-8时按系统代码页转换
        int size_needed = MultiByteToWideChar(CP_ACP, 0, utf8_path_.c_str(), -1, NULL, 0);
        if (size_needed == 0) return std::wstring();

        std::wstring result(size_needed - 1, 0);
        MultiByteToWideChar(CP_ACP, 0, utf8_path_.c_str(), -1, &result[0], size_needed);
        return result;
    }
}
#endif

Path Path::absolute() const {
    if (utf8_path_.empty()) return Path();

    std::error_code ec;
    auto abs = std::filesystem::absolute(toFsPath(*this), ec);
    if (ec) {
        UTILS_DEBUG("Cannot make '{}' absolute: {}", utf8_path_, ec.message());
        return *this;
    }
    return Path(fromFsPath(abs.lexically_normal()));
}

Path Path::parent() const {
    return Path(fromFsPath(toFsPath(*this).parent_path()));
}

std::string Path::filename() const {
    return fromFsPath(toFsPath(*this).filename());
}

Path Path::operator/(const std::string& child) const {
    return Path(fromFsPath(toFsPath(*this) / toFsPath(Path(child))));
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return attributes != INVALID_FILE_ATTRIBUTES;
#else
    std::error_code ec;
    return std::filesystem::exists(utf8_path_, ec);
#endif
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return (attributes != INVALID_FILE_ATTRIBUTES && !(attributes & FILE_ATTRIBUTE_DIRECTORY));
#else
    std::error_code ec;
    return std::filesystem::is_regular_file(utf8_path_, ec);
#endif
}

bool Path::isDirectory() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return (attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_DIRECTORY));
#else
    std::error_code ec;
    return std::filesystem::is_directory(utf8_path_, ec);
#endif
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;

    std::error_code ec;
    auto size = std::filesystem::file_size(toFsPath(*this), ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    return DeleteFileW(wide_path.c_str()) != 0;
#else
    std::error_code ec;
    bool removed = std::filesystem::remove(utf8_path_, ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error removing file '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
#endif
}

bool Path::createDirectories() const {
    if (utf8_path_.empty()) return false;
    if (isDirectory()) return true;

    std::error_code ec;
    std::filesystem::create_directories(toFsPath(*this), ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error creating directory '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return true;
}

FILE* Path::openForRead(bool binary) const {
    if (utf8_path_.empty()) return nullptr;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    std::wstring mode = binary ? L"rb" : L"r";
    FILE* file = nullptr;
    errno_t err = _wfopen_s(&file, wide_path.c_str(), mode.c_str());
    return (err == 0) ? file : nullptr;
#else
    const char* mode = binary ? "rb" : "r";
    return fopen(utf8_path_.c_str(), mode);
#endif
}

FILE* Path::openForWrite(bool binary) const {
    if (utf8_path_.empty()) return nullptr;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    std::wstring mode = binary ? L"wb" : L"w";
    FILE* file = nullptr;
    errno_t err = _wfopen_s(&file, wide_path.c_str(), mode.c_str());
    return (err == 0) ? file : nullptr;
#else
    const char* mode = binary ? "wb" : "w";
    return fopen(utf8_path_.c_str(), mode);
#endif
}

Path Path::executableDirectory() {
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    DWORD length = GetModuleFileNameW(nullptr, &buffer[0], static_cast<DWORD>(buffer.size()));
    while (length == buffer.size()) {
        buffer.resize(buffer.size() * 2);
        length = GetModuleFileNameW(nullptr, &buffer[0], static_cast<DWORD>(buffer.size()));
    }
    if (length > 0) {
        buffer.resize(length);
        return Path(fromFsPath(std::filesystem::path(buffer).parent_path()));
    }
#else
    char buffer[PATH_MAX];
    ssize_t length = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (length > 0) {
        buffer[length] = '\0';
        return Path(fromFsPath(std::filesystem::path(buffer).parent_path()));
    }
#endif
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return Path(ec ? std::string(".") : fromFsPath(cwd));
}

} // namespace core
} // namespace excelpic
