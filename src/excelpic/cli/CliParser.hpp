#pragma once

#include "excelpic/core/Expected.hpp"
#include "excelpic/render/RenderOptions.hpp"
#include "excelpic/utils/Logger.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace excelpic {
namespace cli {

/// 退出码
constexpr int kExitSuccess = 0;
constexpr int kExitExportFailed = 1;
constexpr int kExitUsage = 2;

/**
 * @brief 命令行参数
 */
struct CliOptions {
    std::string excel_file;
    std::string image_file;
    std::optional<std::string> page;
    std::optional<std::string> range;

    std::optional<std::string> format;
    std::optional<int> quality;
    std::optional<double> zoom;

    std::optional<std::string> renderer_path;
    std::optional<std::string> temp_dir;
    std::optional<std::string> log_file;
    Logger::Level log_level = Logger::Level::INFO;

    bool show_help = false;
    bool show_version = false;

    /**
     * @brief 默认渲染选项加上命令行中的覆盖项
     */
    render::RenderOptions renderOptions() const;
};

/**
 * @brief 解析命令行
 * @param args 不含程序名的参数
 * @return 参数错误时返回 InvalidArgument
 */
core::Result<CliOptions> parseArguments(const std::vector<std::string>& args);

void printUsage(std::ostream& out, const std::string& program);

}} // namespace excelpic::cli
