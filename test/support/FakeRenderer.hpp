#pragma once

#include "excelpic/core/Exception.hpp"
#include "excelpic/render/ImageRenderer.hpp"
#include "excelpic/utils/FileWrapper.hpp"
#include <optional>
#include <string>
#include <vector>

namespace excelpic {
namespace test {

/**
 * @brief 测试用渲染器：记录调用，把收到的HTML原样写入输出文件
 */
class FakeRenderer : public render::IImageRenderer {
public:
    struct Call {
        core::Path html_path;
        core::Path image_path;
        std::optional<render::RenderOptions> options;
        bool html_existed = false;
        std::string html_content;
    };

    core::VoidResult render(const core::Path& html_path,
                            const core::Path& image_path,
                            const std::optional<render::RenderOptions>& options) override {
        Call call;
        call.html_path = html_path;
        call.image_path = image_path;
        call.options = options;
        call.html_existed = html_path.isFile();
        if (call.html_existed) {
            call.html_content = utils::FileWrapper::readFile(html_path);
        }
        calls.push_back(call);

        if (failure) {
            return *failure;
        }
        if (throw_on_write) {
            throw core::FileException("Cannot write image", image_path.string(),
                                      core::ErrorCode::FileWriteError);
        }
        utils::FileWrapper::writeFile(image_path, "\x89PNG fake image");
        return core::success();
    }

    std::string getName() const override { return "fake"; }

    std::vector<Call> calls;
    std::optional<core::Error> failure;
    bool throw_on_write = false;
};

}} // namespace excelpic::test
