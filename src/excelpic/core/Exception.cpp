/**
 * @file Exception.cpp
 * @brief ExcelPic异常类实现
 */

#include "Exception.hpp"
#include <fmt/format.h>

namespace excelpic {
namespace core {

ExcelPicException::ExcelPicException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

Error ExcelPicException::toError() const {
    return Error(error_code_, what());
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : ExcelPicException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// AutomationException 实现
AutomationException::AutomationException(const std::string& message,
                                         const std::string& diagnostic,
                                         ErrorCode code, const char* file, int line)
    : ExcelPicException(diagnostic.empty() ? message
                                           : fmt::format("{}. COM error: {}", message, diagnostic),
                        code, file, line)
    , diagnostic_(diagnostic) {
}

// WorkbookOpenException 实现
WorkbookOpenException::WorkbookOpenException(const std::string& message, const std::string& filename,
                                             const char* file, int line)
    : ExcelPicException(fmt::format("Failed to open {}. Error: {}", filename, message),
                        ErrorCode::OpenError, file, line)
    , filename_(filename) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : ExcelPicException(fmt::format("{} (parameter: {})", message, parameter_name),
                        ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

}} // namespace excelpic::core
