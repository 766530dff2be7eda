#pragma once

#include "excelpic/automation/AutomationHost.hpp"
#include "excelpic/core/Path.hpp"
#include "excelpic/render/ImageRenderer.hpp"
#include "excelpic/utils/Logger.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace excelpic {
namespace core {

/**
 * @brief 导出来源：文件路径，或调用方已经打开的文档
 *
 * 由调用方显式选择。默认构造的来源为空，导出时返回 InvalidArgument。
 */
class ExportSource {
public:
    ExportSource() = default;

    static ExportSource fromPath(const Path& path) {
        ExportSource source;
        source.value_ = path;
        return source;
    }

    /**
     * @brief 引用调用方持有的文档，导出过程中不会关闭它
     */
    static ExportSource fromDocument(automation::IWorkbookDocument& document) {
        ExportSource source;
        source.value_ = &document;
        return source;
    }

    bool isEmpty() const { return std::holds_alternative<std::monostate>(value_); }
    bool isPath() const { return std::holds_alternative<Path>(value_); }
    bool isDocument() const { return std::holds_alternative<automation::IWorkbookDocument*>(value_); }

    const Path& path() const { return std::get<Path>(value_); }
    automation::IWorkbookDocument& document() const {
        return *std::get<automation::IWorkbookDocument*>(value_);
    }

private:
    std::variant<std::monostate, Path, automation::IWorkbookDocument*> value_;
};

/**
 * @brief 导出配置
 */
struct ExportConfig {
    Path temp_dir = Path::executableDirectory() / "temporary_files";  // 临时HTML目录，按需创建
    std::optional<Path> renderer_path;                                 // wkhtmltoimage 所在目录
    bool read_only = true;                                             // 以只读方式打开工作簿

    // 为空时分别使用 createDefaultBackend() 和 WkhtmltoimageRenderer
    std::shared_ptr<automation::IAutomationBackend> backend;
    std::shared_ptr<render::IImageRenderer> renderer;
};

/**
 * @brief 日志配置
 */
struct LogOptions {
    std::string log_file;                               // 为空时不写日志
    Logger::Level level = Logger::Level::INFO;
    bool enable_console = false;
    size_t max_file_size = Logger::kDefaultMaxFileSize;
    size_t max_files = Logger::kDefaultMaxFiles;
};

}} // namespace excelpic::core
