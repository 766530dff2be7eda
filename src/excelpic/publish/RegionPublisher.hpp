#pragma once

#include "excelpic/core/ExcelWorkbook.hpp"
#include "excelpic/core/ExportTypes.hpp"
#include "excelpic/core/Expected.hpp"
#include "excelpic/core/RegionSelector.hpp"
#include "excelpic/render/RenderOptions.hpp"
#include <optional>

namespace excelpic {
namespace publish {

/// 宿主解析出的区域：工作表名称 + 绝对地址
using ResolvedRegion = automation::RangeReference;

/**
 * @brief 把打开的工作簿中的一个区域发布为HTML并渲染为图片
 *
 * 所有失败都以 core::Error 返回并记录日志，不抛出异常。
 */
class RegionPublisher {
public:
    explicit RegionPublisher(core::ExcelWorkbook& workbook);

    /**
     * @brief 解析区域
     *
     * 有地址时在应用级别解析限定后的地址（支持命名区域），
     * 否则取工作表的已用区域（未指定工作表时取第一个）。
     */
    core::Result<ResolvedRegion> resolveRegion(const core::RegionSelector& selector);

    /**
     * @brief 以静态HTML方式发布区域（xlSourceRange / xlHtmlStatic）
     */
    core::VoidResult publish(const ResolvedRegion& region, const core::Path& html_path);

    /**
     * @brief 完整流程：解析 -> 发布到临时文件 -> 清理HTML -> 渲染 -> 删除临时文件
     *
     * 临时文件无论渲染是否成功都会删除，删除失败只记录警告。
     */
    core::VoidResult exportRegion(const core::RegionSelector& selector,
                                  const core::Path& image_path,
                                  const std::optional<render::RenderOptions>& options,
                                  const core::ExportConfig& config);

private:
    core::ExcelWorkbook& workbook_;
};

}} // namespace excelpic::publish
