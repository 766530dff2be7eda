#include <gtest/gtest.h>
#include "excelpic/render/ImageRenderer.hpp"
#include "excelpic/render/RenderOptions.hpp"

using excelpic::core::Path;
using excelpic::render::RenderOptions;
using excelpic::render::WkhtmltoimageRenderer;

// 默认选项恰好是 format/quality/zoom 三项
TEST(RenderOptionsTest, DefaultsAreExact) {
    RenderOptions options = RenderOptions::defaults();
    ASSERT_EQ(options.size(), 3u);

    const auto& entries = options.entries();
    EXPECT_EQ(entries[0].first, "format");
    EXPECT_EQ(std::get<std::string>(entries[0].second), "png");
    EXPECT_EQ(entries[1].first, "quality");
    EXPECT_EQ(std::get<int64_t>(entries[1].second), 100);
    EXPECT_EQ(entries[2].first, "zoom");
    EXPECT_EQ(std::get<int64_t>(entries[2].second), 4);

    std::vector<std::string> expected{"--format", "png", "--quality", "100", "--zoom", "4"};
    EXPECT_EQ(options.toArguments(), expected);
}

TEST(RenderOptionsTest, SetReplacesInPlace) {
    RenderOptions options = RenderOptions::defaults();
    options.set("quality", 80);
    options.set("format", "jpg");

    std::vector<std::string> expected{"--format", "jpg", "--quality", "80", "--zoom", "4"};
    EXPECT_EQ(options.toArguments(), expected);
    EXPECT_EQ(options.size(), 3u);
}

TEST(RenderOptionsTest, FlagsAndDoubles) {
    RenderOptions options;
    options.setFlag("transparent");
    options.set("zoom", 1.5);
    options.set("width", static_cast<int64_t>(1024));

    std::vector<std::string> expected{"--transparent", "--zoom", "1.5", "--width", "1024"};
    EXPECT_EQ(options.toArguments(), expected);
}

TEST(RenderOptionsTest, GetAndRemove) {
    RenderOptions options = RenderOptions::defaults();
    EXPECT_TRUE(options.contains("zoom"));
    EXPECT_FALSE(options.contains("width"));
    EXPECT_FALSE(options.get("width").has_value());

    EXPECT_TRUE(options.remove("zoom"));
    EXPECT_FALSE(options.remove("zoom"));
    EXPECT_EQ(options.size(), 2u);
}

TEST(WkhtmltoimageRendererTest, CommandLineLayout) {
    auto argv = WkhtmltoimageRenderer::buildCommandLine(Path("/opt/wk/bin/wkhtmltoimage"),
                                                        Path("/tmp/in.html"), Path("/tmp/out.png"),
                                                        RenderOptions::defaults());
    std::vector<std::string> expected{"/opt/wk/bin/wkhtmltoimage", "--format", "png", "--quality", "100",
                                      "--zoom", "4", "/tmp/in.html", "/tmp/out.png"};
    EXPECT_EQ(argv, expected);
}

TEST(WkhtmltoimageRendererTest, KeepsToolDirectory) {
    WkhtmltoimageRenderer renderer(Path("/opt/wk/bin"));
    ASSERT_TRUE(renderer.getToolDirectory().has_value());
    EXPECT_EQ(renderer.getToolDirectory()->string(), "/opt/wk/bin");
    EXPECT_EQ(renderer.getName(), "wkhtmltoimage");
}
