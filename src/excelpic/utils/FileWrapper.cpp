#include "excelpic/utils/FileWrapper.hpp"

namespace excelpic {
namespace utils {

FileWrapper::FileWrapper(const core::Path& path, Mode mode)
    : path_(path) {
    FILE* raw_file = (mode == Mode::Write) ? path.openForWrite(true) : path.openForRead(true);
    if (!raw_file) {
        throw core::FileException(
            mode == Mode::Write ? "Failed to open file for writing" : "Failed to open file",
            path.string(),
            mode == Mode::Write ? core::ErrorCode::FileWriteError : core::ErrorCode::FileNotFound,
            __FILE__, __LINE__);
    }
    file_.reset(raw_file);
}

std::string FileWrapper::read(size_t max_bytes) {
    std::string buffer(max_bytes, '\0');
    size_t bytes_read = std::fread(&buffer[0], 1, max_bytes, file_.get());
    if (bytes_read < max_bytes && std::ferror(file_.get())) {
        throw core::FileException("Failed to read file", path_.string(),
                                  core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }
    buffer.resize(bytes_read);
    return buffer;
}

std::string FileWrapper::readAll() {
    std::string content;
    char chunk[8192];
    size_t bytes_read = 0;
    while ((bytes_read = std::fread(chunk, 1, sizeof(chunk), file_.get())) > 0) {
        content.append(chunk, bytes_read);
    }
    if (std::ferror(file_.get())) {
        throw core::FileException("Failed to read file", path_.string(),
                                  core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }
    return content;
}

void FileWrapper::write(const std::string& content) {
    if (!content.empty() &&
        std::fwrite(content.data(), 1, content.size(), file_.get()) != content.size()) {
        throw core::FileException("Failed to write file", path_.string(),
                                  core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }
}

void FileWrapper::close() {
    FILE* raw_file = file_.release();
    if (raw_file && std::fclose(raw_file) != 0) {
        throw core::FileException("Failed to close file", path_.string(),
                                  core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }
}

std::string FileWrapper::readFile(const core::Path& path) {
    FileWrapper file(path, Mode::Read);
    return file.readAll();
}

std::string FileWrapper::readPrefix(const core::Path& path, size_t max_bytes) {
    FileWrapper file(path, Mode::Read);
    return file.read(max_bytes);
}

void FileWrapper::writeFile(const core::Path& path, const std::string& content) {
    FileWrapper file(path, Mode::Write);
    file.write(content);
    file.close();
}

} // namespace utils
} // namespace excelpic
