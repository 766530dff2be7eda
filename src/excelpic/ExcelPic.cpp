#include "excelpic/ExcelPic.hpp"
#include "excelpic/publish/RegionPublisher.hpp"
#include "excelpic/utils/Logger.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include <iostream>
#include <optional>
#include <utility>

namespace excelpic {

bool initialize(const core::LogOptions& options) {
    if (options.log_file.empty()) {
        return true;
    }

    try {
        bool ok = Logger::getInstance().initialize(options.log_file, options.level, options.enable_console,
                                                   options.max_file_size, options.max_files);
        if (!ok) {
            if (options.enable_console) {
                std::cerr << "Failed to open log file: " << options.log_file << std::endl;
            }
            return false;
        }
        EXPORT_INFO("ExcelPic initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统初始化失败时输出到标准错误
        if (options.enable_console) {
            std::cerr << "Failed to initialize ExcelPic: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    if (Logger::getInstance().isInitialized()) {
        EXPORT_INFO("ExcelPic cleanup completed");
    }
    Logger::getInstance().shutdown();
}

Exporter::Exporter(core::ExportConfig config)
    : config_(std::move(config)) {}

core::VoidResult Exporter::exportFromWorkbook(core::ExcelWorkbook& workbook,
                                              const core::Path& image_path,
                                              const core::RegionSelector& selector,
                                              const std::optional<render::RenderOptions>& options) const {
    publish::RegionPublisher publisher(workbook);
    return publisher.exportRegion(selector, image_path, options, config_);
}

core::VoidResult Exporter::exportImage(const core::ExportSource& source,
                                       const core::Path& image_path,
                                       const std::optional<std::string>& page,
                                       const std::optional<std::string>& range,
                                       const std::optional<render::RenderOptions>& options) const {
    core::RegionSelector selector(page, range);

    if (source.isEmpty()) {
        EXPORT_ERROR("Export requested without a workbook path or document");
        return core::makeError(core::ErrorCode::InvalidArgument,
                               "Export source must be a workbook path or an open document");
    }

    if (source.isDocument()) {
        core::ExcelWorkbook workbook(source.document());
        return exportFromWorkbook(workbook, image_path, selector, options);
    }

    EXPORT_INFO("Exporting {} -> {}", source.path().string(), image_path.string());
    std::optional<core::ExcelWorkbook> workbook;
    try {
        workbook.emplace(core::ExcelWorkbook::open(source.path(), config_.read_only, config_.backend));
    } catch (const core::ExcelPicException& e) {
        EXPORT_ERROR("Cannot open {}: {}", source.path().string(), e.what());
        return e.toError();
    }

    core::VoidResult result = core::success();
    try {
        result = exportFromWorkbook(*workbook, image_path, selector, options);
    } catch (const core::ExcelPicException& e) {
        EXPORT_ERROR("Export of {} failed: {}", source.path().string(), e.what());
        result = e.toError();
    }

    if (!workbook->close()) {
        EXPORT_WARN("Workbook {} was not closed cleanly", source.path().string());
    }
    return result;
}

core::VoidResult exportImage(const core::ExportSource& source,
                             const core::Path& image_path,
                             const std::optional<std::string>& page,
                             const std::optional<std::string>& range,
                             const std::optional<render::RenderOptions>& options,
                             const core::ExportConfig& config) {
    Exporter exporter(config);
    return exporter.exportImage(source, image_path, page, range, options);
}

} // namespace excelpic
