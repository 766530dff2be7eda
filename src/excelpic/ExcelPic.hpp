#pragma once

// ExcelPic - 把Excel工作表区域导出为图片

#include <optional>
#include <string>

#include "excelpic/core/ErrorCode.hpp"
#include "excelpic/core/Exception.hpp"
#include "excelpic/core/Expected.hpp"
#include "excelpic/core/ExcelWorkbook.hpp"
#include "excelpic/core/ExportTypes.hpp"
#include "excelpic/core/Path.hpp"
#include "excelpic/core/RegionSelector.hpp"
#include "excelpic/render/ImageRenderer.hpp"
#include "excelpic/render/RenderOptions.hpp"

// 版本信息
#define EXCELPIC_VERSION_MAJOR 1
#define EXCELPIC_VERSION_MINOR 0
#define EXCELPIC_VERSION_PATCH 0
#define EXCELPIC_VERSION_STRING "1.0.0"

namespace excelpic {

inline std::string getVersion() {
    return EXCELPIC_VERSION_STRING;
}

/**
 * @brief 初始化日志
 * @param options 日志配置，log_file 为空时日志被丢弃
 * @return 初始化是否成功
 */
bool initialize(const core::LogOptions& options = core::LogOptions());

/**
 * @brief 刷新并关闭日志
 */
void cleanup();

/**
 * @brief 单次导出请求的执行器
 */
class Exporter {
public:
    explicit Exporter(core::ExportConfig config = core::ExportConfig());

    /**
     * @brief 导出区域为图片
     *
     * 路径来源：打开工作簿，导出结束（包括失败）后关闭。
     * 文档来源：直接使用，不打开也不关闭。
     *
     * @param source 工作簿路径或已打开的文档
     * @param image_path 输出图片
     * @param page 工作表名称
     * @param range 地址或命名区域，可带 "Sheet!" 限定
     * @param options 渲染选项，为空时使用默认值
     * @return 失败时的错误码：InvalidArgument、FileNotFound、AutomationError、
     *         AutomationUnavailable、OpenError、PublishFailed、RendererNotFound、
     *         RenderFailed、FileReadError、FileWriteError
     */
    core::VoidResult exportImage(const core::ExportSource& source,
                                 const core::Path& image_path,
                                 const std::optional<std::string>& page = std::nullopt,
                                 const std::optional<std::string>& range = std::nullopt,
                                 const std::optional<render::RenderOptions>& options = std::nullopt) const;

    const core::ExportConfig& getConfig() const { return config_; }

private:
    core::VoidResult exportFromWorkbook(core::ExcelWorkbook& workbook,
                                        const core::Path& image_path,
                                        const core::RegionSelector& selector,
                                        const std::optional<render::RenderOptions>& options) const;

    core::ExportConfig config_;
};

/**
 * @brief 使用给定配置执行一次导出
 */
core::VoidResult exportImage(const core::ExportSource& source,
                             const core::Path& image_path,
                             const std::optional<std::string>& page = std::nullopt,
                             const std::optional<std::string>& range = std::nullopt,
                             const std::optional<render::RenderOptions>& options = std::nullopt,
                             const core::ExportConfig& config = core::ExportConfig());

} // namespace excelpic
