#include "excelpic/core/ErrorCode.hpp"

namespace excelpic {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";

        // 自动化宿主错误
        case ErrorCode::AutomationError:
            return "Automation error";
        case ErrorCode::OpenError:
            return "Workbook open error";
        case ErrorCode::AutomationUnavailable:
            return "Automation host unavailable";

        // 导出流程错误
        case ErrorCode::PublishFailed:
            return "Publish failed";
        case ErrorCode::RenderFailed:
            return "Render failed";
        case ErrorCode::RendererNotFound:
            return "Renderer not found";

        default:
            return "Unknown error";
    }
}

}} // namespace excelpic::core
