#pragma once

#include "excelpic/core/Expected.hpp"
#include "excelpic/core/Path.hpp"
#include "excelpic/render/RenderOptions.hpp"
#include <optional>
#include <string>

namespace excelpic {
namespace render {

/**
 * @brief HTML到图片的渲染接口
 */
class IImageRenderer {
public:
    virtual ~IImageRenderer() = default;

    /**
     * @brief 渲染HTML文件为图片
     * @param html_path 已清理的HTML文件
     * @param image_path 输出图片路径
     * @param options 渲染选项，为空时使用 RenderOptions::defaults()
     * @return 失败时返回 RendererNotFound 或 RenderFailed
     */
    virtual core::VoidResult render(const core::Path& html_path,
                                    const core::Path& image_path,
                                    const std::optional<RenderOptions>& options) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief 调用外部 wkhtmltoimage 程序的渲染器
 *
 * 命令行：wkhtmltoimage [--key value]... in.html out.img
 */
class WkhtmltoimageRenderer : public IImageRenderer {
public:
    static constexpr const char* kExecutableName = "wkhtmltoimage";

    /**
     * @param tool_dir 优先于 PATH 搜索的目录，只影响本渲染器
     */
    explicit WkhtmltoimageRenderer(std::optional<core::Path> tool_dir = std::nullopt);

    core::VoidResult render(const core::Path& html_path,
                            const core::Path& image_path,
                            const std::optional<RenderOptions>& options) override;

    std::string getName() const override { return kExecutableName; }

    /**
     * @brief 组装完整参数列表（argv[0] 为可执行文件）
     */
    static std::vector<std::string> buildCommandLine(const core::Path& executable,
                                                     const core::Path& html_path,
                                                     const core::Path& image_path,
                                                     const RenderOptions& options);

    const std::optional<core::Path>& getToolDirectory() const { return tool_dir_; }

private:
    std::optional<core::Path> tool_dir_;
};

}} // namespace excelpic::render
