#include "excelpic/publish/RegionPublisher.hpp"
#include "excelpic/core/Exception.hpp"
#include "excelpic/markup/MarkupSanitizer.hpp"
#include "excelpic/utils/FileNameGenerator.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include <memory>
#include <utility>

namespace excelpic {
namespace publish {

namespace {

/**
 * @brief 临时HTML文件，离开作用域时删除
 */
class TemporaryFile {
public:
    explicit TemporaryFile(core::Path path) : path_(std::move(path)) {}
    ~TemporaryFile() {
        if (path_.exists() && !path_.remove()) {
            PUBLISH_WARN("Failed to delete temporary file {}", path_.string());
        }
    }

    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;

    const core::Path& path() const { return path_; }

private:
    core::Path path_;
};

} // namespace

RegionPublisher::RegionPublisher(core::ExcelWorkbook& workbook)
    : workbook_(workbook) {}

core::Result<ResolvedRegion> RegionPublisher::resolveRegion(const core::RegionSelector& selector) {
    try {
        if (selector.hasAddress()) {
            const std::string address = selector.qualifiedAddress();
            PUBLISH_DEBUG("Resolving range {}", address);
            ResolvedRegion region = workbook_.application().range(address);
            PUBLISH_DEBUG("Resolved {} to {}!{}", address, region.sheet_name, region.address);
            return region;
        }

        std::optional<std::string> page;
        if (selector.hasPage()) {
            page = selector.page;
        }
        PUBLISH_DEBUG("Resolving used range of {}", page ? *page : std::string("first sheet"));
        ResolvedRegion region = workbook_.document().usedRange(page);
        PUBLISH_DEBUG("Used range is {}!{}", region.sheet_name, region.address);
        return region;
    } catch (const core::ExcelPicException& e) {
        PUBLISH_ERROR("Failed to resolve region: {}", e.what());
        return e.toError();
    }
}

core::VoidResult RegionPublisher::publish(const ResolvedRegion& region, const core::Path& html_path) {
    automation::HtmlPublishRequest request;
    request.filename = html_path;
    request.sheet_name = region.sheet_name;
    request.source = region.address;
    request.source_type = automation::kSourceTypeRange;
    request.html_type = automation::kHtmlTypeStatic;

    try {
        workbook_.document().publishHtml(request);
    } catch (const core::AutomationException& e) {
        PUBLISH_ERROR("Publishing {}!{} failed: {}", region.sheet_name, region.address, e.what());
        return e.toError();
    } catch (const core::ExcelPicException& e) {
        PUBLISH_ERROR("Publishing {}!{} failed: {}", region.sheet_name, region.address, e.what());
        return core::makeError(core::ErrorCode::PublishFailed, e.what(), html_path.string());
    }

    if (!html_path.isFile()) {
        PUBLISH_ERROR("Host reported success but {} was not written", html_path.string());
        return core::makeError(core::ErrorCode::PublishFailed, "Published HTML file is missing",
                               html_path.string());
    }

    PUBLISH_INFO("Published {}!{} to {}", region.sheet_name, region.address, html_path.string());
    return core::success();
}

core::VoidResult RegionPublisher::exportRegion(const core::RegionSelector& selector,
                                               const core::Path& image_path,
                                               const std::optional<render::RenderOptions>& options,
                                               const core::ExportConfig& config) {
    auto region = resolveRegion(selector);
    if (!region) {
        return region.error();
    }

    if (!config.temp_dir.createDirectories()) {
        PUBLISH_ERROR("Cannot create temporary directory {}", config.temp_dir.string());
        return core::makeError(core::ErrorCode::FileWriteError, "Cannot create temporary directory",
                               config.temp_dir.string());
    }

    TemporaryFile html(config.temp_dir / utils::FileNameGenerator::generateHashedFilename("html"));

    auto published = publish(*region, html.path());
    if (!published) {
        return published;
    }

    try {
        std::string charset = markup::MarkupSanitizer::sanitize(html.path());
        PUBLISH_DEBUG("Sanitized {} ({})", html.path().string(), charset);
    } catch (const core::FileException& e) {
        PUBLISH_ERROR("Failed to sanitize {}: {}", html.path().string(), e.what());
        return e.toError();
    }

    std::shared_ptr<render::IImageRenderer> renderer = config.renderer;
    if (!renderer) {
        renderer = std::make_shared<render::WkhtmltoimageRenderer>(config.renderer_path);
    }

    auto rendered = renderer->render(html.path(), image_path, options);
    if (!rendered) {
        PUBLISH_ERROR("Rendering {} failed: {}", image_path.string(), rendered.error().fullMessage());
        return rendered;
    }

    PUBLISH_INFO("Exported {}!{} to {}", region->sheet_name, region->address, image_path.string());
    return core::success();
}

}} // namespace excelpic::publish
