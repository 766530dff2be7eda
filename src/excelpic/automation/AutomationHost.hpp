#pragma once

#include "excelpic/core/Path.hpp"
#include <memory>
#include <optional>
#include <string>

namespace excelpic {
namespace automation {

/**
 * @file AutomationHost.hpp
 * @brief 电子表格宿主程序的自动化接口
 *
 * 导出流程只依赖这里的原语：启动/退出宿主、打开/关闭文档、
 * 按地址解析区域、取工作表已用区域、一次性HTML发布。
 * 所有方法在宿主拒绝或执行失败时抛出 core::AutomationException。
 */

/// XlSourceType::xlSourceRange
constexpr int kSourceTypeRange = 4;
/// XlHtmlType::xlHtmlStatic
constexpr int kHtmlTypeStatic = 0;

/**
 * @brief 宿主解析出的具体区域
 */
struct RangeReference {
    std::string sheet_name;   // 区域所在工作表名称
    std::string address;      // 宿主给出的绝对地址，如 "$A$1:$U$8"
};

/**
 * @brief 一次性HTML发布请求
 */
struct HtmlPublishRequest {
    core::Path filename;
    std::string sheet_name;
    std::string source;
    int source_type = kSourceTypeRange;
    int html_type = kHtmlTypeStatic;
};

class IApplication;

/**
 * @brief 宿主中打开的一个工作簿文档
 */
class IWorkbookDocument {
public:
    virtual ~IWorkbookDocument() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief 文档所属的宿主应用
     */
    virtual IApplication& getApplication() = 0;

    /**
     * @brief 获取工作表的已用区域
     * @param sheet 工作表名称，为空时取第一个工作表
     */
    virtual RangeReference usedRange(const std::optional<std::string>& sheet) = 0;

    /**
     * @brief 创建发布对象并执行一次发布
     */
    virtual void publishHtml(const HtmlPublishRequest& request) = 0;

    /**
     * @brief 关闭文档
     * @param save_changes 是否保存修改
     */
    virtual void close(bool save_changes) = 0;
};

/**
 * @brief 宿主应用实例
 */
class IApplication {
public:
    virtual ~IApplication() = default;

    virtual void setVisible(bool visible) = 0;
    virtual void setDisplayAlerts(bool display) = 0;
    virtual void setAskToUpdateLinks(bool ask) = 0;

    /**
     * @brief 打开工作簿（不更新外部链接）
     * @param path 绝对路径
     */
    virtual std::unique_ptr<IWorkbookDocument> openWorkbook(const core::Path& path, bool read_only) = 0;

    /**
     * @brief 在应用级别解析地址（支持命名区域和跨表引用）
     */
    virtual RangeReference range(const std::string& address) = 0;

    /**
     * @brief 退出宿主进程
     */
    virtual void quit() = 0;
};

/**
 * @brief 当前线程的自动化子系统
 *
 * 构造时初始化，析构时清理（COM下即 CoInitializeEx/CoUninitialize）。
 */
class IAutomationSession {
public:
    virtual ~IAutomationSession() = default;
};

/**
 * @brief 自动化后端：创建会话、启动宿主
 */
class IAutomationBackend {
public:
    virtual ~IAutomationBackend() = default;

    virtual std::unique_ptr<IAutomationSession> createSession() = 0;

    /**
     * @brief 启动一个新的宿主实例
     * @note 必须在 createSession() 之后、会话存活期间调用
     */
    virtual std::unique_ptr<IApplication> launchApplication() = 0;

    virtual std::string getTypeName() const = 0;
};

/**
 * @brief 当前平台的默认后端
 *
 * Windows 下为 COM 自动化，其他平台返回的后端在启动宿主时
 * 抛出 AutomationException(AutomationUnavailable)。
 */
std::shared_ptr<IAutomationBackend> createDefaultBackend();

}} // namespace excelpic::automation
