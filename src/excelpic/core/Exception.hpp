/**
 * @file Exception.hpp
 * @brief ExcelPic异常类定义
 */

#ifndef EXCELPIC_EXCEPTION_HPP
#define EXCELPIC_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include "ErrorCode.hpp"

namespace excelpic {
namespace core {

/**
 * @brief ExcelPic基础异常类
 */
class ExcelPicException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    ExcelPicException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 转换为结果通道使用的错误对象
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 文件相关异常（文件不存在、读写失败）
 */
class FileException : public ExcelPicException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 自动化宿主拒绝或执行失败
 *
 * diagnostic 保存宿主返回的原始诊断信息（HRESULT、异常描述等）。
 */
class AutomationException : public ExcelPicException {
public:
    AutomationException(const std::string& message,
                        const std::string& diagnostic = "",
                        ErrorCode code = ErrorCode::AutomationError,
                        const char* file = nullptr, int line = 0);

    const std::string& getDiagnostic() const { return diagnostic_; }

private:
    std::string diagnostic_;
};

/**
 * @brief 打开工作簿时发生的非自动化I/O错误
 */
class WorkbookOpenException : public ExcelPicException {
public:
    WorkbookOpenException(const std::string& message, const std::string& filename,
                          const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public ExcelPicException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

} // namespace core
} // namespace excelpic

#endif // EXCELPIC_EXCEPTION_HPP
