#include "excelpic/render/ImageRenderer.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include "excelpic/utils/ProcessRunner.hpp"
#include <fmt/format.h>

namespace excelpic {
namespace render {

WkhtmltoimageRenderer::WkhtmltoimageRenderer(std::optional<core::Path> tool_dir)
    : tool_dir_(std::move(tool_dir)) {}

std::vector<std::string> WkhtmltoimageRenderer::buildCommandLine(const core::Path& executable,
                                                                 const core::Path& html_path,
                                                                 const core::Path& image_path,
                                                                 const RenderOptions& options) {
    std::vector<std::string> argv;
    argv.push_back(executable.string());
    for (auto& arg : options.toArguments()) {
        argv.push_back(std::move(arg));
    }
    argv.push_back(html_path.string());
    argv.push_back(image_path.string());
    return argv;
}

core::VoidResult WkhtmltoimageRenderer::render(const core::Path& html_path,
                                               const core::Path& image_path,
                                               const std::optional<RenderOptions>& options) {
    auto executable = utils::ProcessRunner::resolveExecutable(kExecutableName, tool_dir_);
    if (!executable) {
        RENDER_ERROR("{} not found (tool dir: {})", kExecutableName,
                     tool_dir_ ? tool_dir_->string() : std::string("<none>"));
        return core::makeError(core::ErrorCode::RendererNotFound,
                               fmt::format("{} executable not found", kExecutableName),
                               tool_dir_ ? tool_dir_->string() : std::string());
    }

    // 未提供或为空的选项集都使用默认值
    const RenderOptions& effective = (options && !options->empty()) ? *options : RenderOptions::defaults();
    auto argv = buildCommandLine(*executable, html_path, image_path, effective);
    RENDER_INFO("Rendering {} -> {}", html_path.string(), image_path.string());

    auto exit_code = utils::ProcessRunner::run(argv);
    if (!exit_code) {
        RENDER_ERROR("Failed to run {}: {}", executable->string(), exit_code.error().fullMessage());
        return core::makeError(core::ErrorCode::RenderFailed, exit_code.error().message,
                               executable->string());
    }
    if (*exit_code != 0) {
        RENDER_ERROR("{} exited with code {}", executable->string(), *exit_code);
        return core::makeError(core::ErrorCode::RenderFailed,
                               fmt::format("{} exited with code {}", kExecutableName, *exit_code),
                               image_path.string());
    }

    RENDER_DEBUG("Rendered {}", image_path.string());
    return core::success();
}

}} // namespace excelpic::render
