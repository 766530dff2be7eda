#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace excelpic {
namespace core {

/**
 * @brief ExcelPic统一错误码
 *
 * 每个导出阶段都返回错误码，调用方可以区分失败原因。
 * 抛出异常的接口通过 ExcelPicException::toError() 转回错误码。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileWriteError = 23,
    FileReadError = 24,

    // 自动化宿主错误 (40-59)
    AutomationError = 40,
    OpenError = 41,
    AutomationUnavailable = 42,

    // 导出流程错误 (60-79)
    PublishFailed = 60,
    RenderFailed = 61,
    RendererNotFound = 62
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace excelpic::core
