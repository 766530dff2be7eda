#pragma once

#include "excelpic/automation/AutomationHost.hpp"
#include "excelpic/core/Path.hpp"
#include <memory>

namespace excelpic {
namespace core {

/**
 * @brief 工作簿状态
 */
enum class WorkbookState {
    UNOPENED,   // 尚未打开
    OPEN,       // 文档可用
    CLOSED      // 已关闭，再次关闭为空操作
};

/**
 * @brief 自动化宿主中打开的工作簿句柄
 *
 * 自己打开的工作簿拥有会话、宿主进程和文档三个引用，close() 或析构时
 * 按 文档 -> 宿主 -> 会话 的顺序各释放一次。包装调用方文档时只借用，
 * 从不关闭文档或退出宿主。
 *
 * 只能移动，不能复制。
 */
class ExcelWorkbook {
public:
    /**
     * @brief 打开工作簿
     * @param path 工作簿路径，内部转换为绝对路径
     * @param read_only 是否只读打开
     * @param backend 自动化后端，为空时使用 createDefaultBackend()
     * @throws FileException 文件不存在（FileNotFound），此时尚未创建会话
     * @throws AutomationException 宿主拒绝或执行失败
     * @throws WorkbookOpenException 其他I/O错误（OpenError）
     */
    static ExcelWorkbook open(const Path& path, bool read_only = true,
                              std::shared_ptr<automation::IAutomationBackend> backend = nullptr);

    /**
     * @brief 包装调用方已经打开的文档（借用，不负责关闭）
     */
    explicit ExcelWorkbook(automation::IWorkbookDocument& document);

    ~ExcelWorkbook();

    ExcelWorkbook(const ExcelWorkbook&) = delete;
    ExcelWorkbook& operator=(const ExcelWorkbook&) = delete;
    ExcelWorkbook(ExcelWorkbook&& other) noexcept;
    ExcelWorkbook& operator=(ExcelWorkbook&& other) noexcept;

    /**
     * @brief 关闭文档（不保存）、退出宿主、结束会话
     *
     * 幂等；每一步的失败都会记录日志并继续后续步骤。
     * @return 所有步骤是否都成功
     */
    bool close();

    WorkbookState getState() const { return state_; }
    bool isOpen() const { return state_ == WorkbookState::OPEN; }

    /**
     * @brief 是否拥有文档（自己打开的）
     */
    bool ownsDocument() const { return document_ != nullptr; }

    /**
     * @brief 当前文档
     * @throws ExcelPicException 未打开或已关闭
     */
    automation::IWorkbookDocument& document();

    /**
     * @brief 文档所属的宿主应用
     */
    automation::IApplication& application();

    const Path& getPath() const { return path_; }

private:
    ExcelWorkbook() = default;

    std::shared_ptr<automation::IAutomationBackend> backend_;
    std::unique_ptr<automation::IAutomationSession> session_;
    std::unique_ptr<automation::IApplication> application_;
    std::unique_ptr<automation::IWorkbookDocument> document_;
    automation::IWorkbookDocument* borrowed_ = nullptr;

    Path path_;
    WorkbookState state_ = WorkbookState::UNOPENED;
};

}} // namespace excelpic::core
