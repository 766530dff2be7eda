#include <gtest/gtest.h>
#include "excelpic/core/ErrorCode.hpp"
#include "excelpic/core/Exception.hpp"
#include "excelpic/core/Expected.hpp"

using namespace excelpic::core;

TEST(ErrorCodeTest, ToStringCoversExportCodes) {
    EXPECT_STREQ(toString(ErrorCode::Ok), "Success");
    EXPECT_STREQ(toString(ErrorCode::FileNotFound), "File not found");
    EXPECT_STREQ(toString(ErrorCode::AutomationUnavailable), "Automation host unavailable");
    EXPECT_STREQ(toString(ErrorCode::PublishFailed), "Publish failed");
    EXPECT_STREQ(toString(ErrorCode::RendererNotFound), "Renderer not found");
}

TEST(ErrorCodeTest, FullMessageAppendsContext) {
    EXPECT_EQ(makeError(ErrorCode::RenderFailed, "exit 1").fullMessage(), "exit 1");
    EXPECT_EQ(makeError(ErrorCode::RenderFailed, "exit 1", "/usr/bin/wkhtmltoimage").fullMessage(),
              "exit 1 (Context: /usr/bin/wkhtmltoimage)");
    EXPECT_EQ(makeError(ErrorCode::OpenError).message, "Workbook open error");
}

// 异常回到结果通道时保留错误码和消息
TEST(ErrorCodeTest, ExceptionsConvertToErrors) {
    FileException file("Failed to write file", "out.png", ErrorCode::FileWriteError);
    Error error = file.toError();
    EXPECT_EQ(error.code, ErrorCode::FileWriteError);
    EXPECT_EQ(error.message, "Failed to write file (file: out.png)");
    EXPECT_TRUE(error.context.empty());

    AutomationException automation("Workbooks.Open failed", "0x800A03EC");
    EXPECT_EQ(automation.toError().code, ErrorCode::AutomationError);
    EXPECT_EQ(automation.toError().message, "Workbooks.Open failed. COM error: 0x800A03EC");

    WorkbookOpenException open("disk error", "book.xlsx");
    EXPECT_EQ(open.toError().code, ErrorCode::OpenError);
    EXPECT_EQ(open.getFilename(), "book.xlsx");
}

TEST(ExpectedTest, VoidResultCarriesError) {
    VoidResult ok = success();
    EXPECT_TRUE(ok.hasValue());

    VoidResult failed = makeError(ErrorCode::PublishFailed, "missing html");
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code, ErrorCode::PublishFailed);

    Result<int> value = 7;
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, 7);
}
