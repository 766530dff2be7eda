#pragma once

#include "excelpic/utils/FileNameGenerator.hpp"
#include <filesystem>
#include <string>

namespace excelpic {
namespace test {

/**
 * @brief 测试用临时目录，析构时递归删除
 */
class TempDirectory {
public:
    TempDirectory() {
        path_ = std::filesystem::temp_directory_path() /
                ("excelpic_test_" + utils::FileNameGenerator::randomUuid());
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    size_t countEntries(const std::string& sub_dir = "") const {
        std::filesystem::path dir = sub_dir.empty() ? path_ : path_ / sub_dir;
        if (!std::filesystem::exists(dir)) {
            return 0;
        }
        size_t count = 0;
        for (auto it = std::filesystem::directory_iterator(dir); it != std::filesystem::directory_iterator(); ++it) {
            ++count;
        }
        return count;
    }

private:
    std::filesystem::path path_;
};

}} // namespace excelpic::test
