#include <gtest/gtest.h>
#include "excelpic/render/ImageRenderer.hpp"
#include "excelpic/utils/FileWrapper.hpp"
#include "excelpic/utils/ProcessRunner.hpp"
#include "../support/TempDirectory.hpp"
#include <filesystem>

using excelpic::core::ErrorCode;
using excelpic::core::Path;
using excelpic::render::RenderOptions;
using excelpic::render::WkhtmltoimageRenderer;
using excelpic::utils::FileWrapper;
using excelpic::utils::ProcessRunner;

TEST(ProcessRunnerTest, QuotesWindowsArguments) {
    EXPECT_EQ(ProcessRunner::quoteArgument("plain"), "plain");
    EXPECT_EQ(ProcessRunner::quoteArgument(""), "\"\"");
    EXPECT_EQ(ProcessRunner::quoteArgument("C:\\Program Files\\wk"), "\"C:\\Program Files\\wk\"");
    EXPECT_EQ(ProcessRunner::quoteArgument("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(ProcessRunner::quoteArgument("dir with space\\"), "\"dir with space\\\\\"");
}

#ifndef _WIN32

class ProcessRunnerPosixTest : public ::testing::Test {
protected:
    // 在临时目录中创建可执行脚本
    Path writeScript(const std::string& name, const std::string& body) {
        Path path(temp.file(name));
        FileWrapper::writeFile(path, "#!/bin/sh\n" + body + "\n");
        std::filesystem::permissions(temp.path() / name,
                                     std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read | std::filesystem::perms::group_exec,
                                     std::filesystem::perm_options::replace);
        return path;
    }

    excelpic::test::TempDirectory temp;
};

TEST_F(ProcessRunnerPosixTest, ResolvesFromPath) {
    auto sh = ProcessRunner::resolveExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(sh->isFile());
    EXPECT_EQ(sh->string().front(), '/');
}

// 指定目录优先于 PATH
TEST_F(ProcessRunnerPosixTest, SearchDirectoryTakesPrecedence) {
    Path script = writeScript("sh", "exit 0");
    auto resolved = ProcessRunner::resolveExecutable("sh", Path(temp.path().string()));
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->string(), script.absolute().string());
}

TEST_F(ProcessRunnerPosixTest, NonExecutableFileIsSkipped) {
    FileWrapper::writeFile(Path(temp.file("excelpic-no-such-tool")), "data");
    EXPECT_FALSE(ProcessRunner::resolveExecutable("excelpic-no-such-tool", Path(temp.path().string())).has_value());
    EXPECT_FALSE(ProcessRunner::resolveExecutable("").has_value());
}

TEST_F(ProcessRunnerPosixTest, ReturnsExitCode) {
    Path script = writeScript("exit3.sh", "exit 3");
    auto result = ProcessRunner::run({script.string()});
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(*result, 3);
}

TEST_F(ProcessRunnerPosixTest, PassesArgumentsUnchanged) {
    Path script = writeScript("echo.sh", "printf '%s|' \"$@\" > \"$1\"");
    std::string out = temp.file("args with space.txt");
    auto result = ProcessRunner::run({script.string(), out, "two words", "--flag"});
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(*result, 0);
    EXPECT_EQ(FileWrapper::readFile(Path(out)), out + "|two words|--flag|");
}

TEST_F(ProcessRunnerPosixTest, MissingProgramExits127) {
    auto result = ProcessRunner::run({temp.file("does-not-exist")});
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(*result, 127);

    EXPECT_TRUE(ProcessRunner::run({}).hasError());
}

// 用脚本代替 wkhtmltoimage，检查参数和退出码处理
TEST_F(ProcessRunnerPosixTest, RendererRunsToolFromDirectory) {
    writeScript("wkhtmltoimage", "for a; do last=$a; done\nprintf '%s ' \"$@\" > \"$last\"");
    WkhtmltoimageRenderer renderer(Path(temp.path().string()));

    Path html(temp.file("in.html"));
    Path image(temp.file("out.png"));
    FileWrapper::writeFile(html, "<html></html>");

    auto result = renderer.render(html, image, std::nullopt);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(FileWrapper::readFile(image),
              "--format png --quality 100 --zoom 4 " + html.string() + " " + image.string() + " ");
}

TEST_F(ProcessRunnerPosixTest, RendererUsesDefaultsForEmptyOptions) {
    writeScript("wkhtmltoimage", "for a; do last=$a; done\nprintf '%s ' \"$@\" > \"$last\"");
    WkhtmltoimageRenderer renderer(Path(temp.path().string()));

    Path html(temp.file("in.html"));
    Path image(temp.file("out.png"));
    FileWrapper::writeFile(html, "<html></html>");

    auto result = renderer.render(html, image, RenderOptions{});
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(FileWrapper::readFile(image),
              "--format png --quality 100 --zoom 4 " + html.string() + " " + image.string() + " ");
}

TEST_F(ProcessRunnerPosixTest, RendererReportsNonZeroExit) {
    writeScript("wkhtmltoimage", "exit 1");
    WkhtmltoimageRenderer renderer(Path(temp.path().string()));

    auto result = renderer.render(Path(temp.file("in.html")), Path(temp.file("out.png")),
                                  RenderOptions::defaults());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::RenderFailed);
}

TEST_F(ProcessRunnerPosixTest, RendererNotFound) {
    if (ProcessRunner::resolveExecutable(WkhtmltoimageRenderer::kExecutableName).has_value()) {
        GTEST_SKIP() << "wkhtmltoimage is installed on PATH";
    }
    WkhtmltoimageRenderer renderer(Path(temp.path().string()));
    auto result = renderer.render(Path(temp.file("in.html")), Path(temp.file("out.png")), std::nullopt);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::RendererNotFound);
}

#endif
