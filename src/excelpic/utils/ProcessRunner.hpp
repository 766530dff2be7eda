#pragma once

#include "excelpic/core/Expected.hpp"
#include "excelpic/core/Path.hpp"
#include <optional>
#include <string>
#include <vector>

namespace excelpic {
namespace utils {

/**
 * @brief 外部进程工具
 *
 * 可执行文件按调用解析：先查指定目录，再查 PATH。解析结果以绝对路径
 * 传给子进程，不修改当前进程的环境变量。
 */
class ProcessRunner {
public:
    /**
     * @brief 查找可执行文件
     * @param name 程序名（Windows 下缺少扩展名时自动补 .exe）
     * @param search_dir 优先搜索的目录
     * @return 找到时返回绝对路径
     */
    static std::optional<core::Path> resolveExecutable(const std::string& name,
                                                       const std::optional<core::Path>& search_dir = std::nullopt);

    /**
     * @brief 同步运行子进程并等待结束
     * @param argv argv[0] 为可执行文件的完整路径
     * @return 子进程退出码；无法启动或被信号终止时返回错误
     */
    static core::Result<int> run(const std::vector<std::string>& argv);

    /**
     * @brief 按 Windows 命令行规则引用单个参数
     */
    static std::string quoteArgument(const std::string& arg);
};

}} // namespace excelpic::utils
