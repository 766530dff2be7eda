#pragma once

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <oaidl.h>
#ifdef ERROR
#undef ERROR
#endif

#include "excelpic/automation/AutomationHost.hpp"
#include <string>
#include <vector>

namespace excelpic {
namespace automation {

/**
 * @brief VARIANT 的RAII包装
 */
class ComVariant {
public:
    ComVariant();
    ~ComVariant();

    ComVariant(const ComVariant& other);
    ComVariant& operator=(const ComVariant& other);
    ComVariant(ComVariant&& other) noexcept;
    ComVariant& operator=(ComVariant&& other) noexcept;

    static ComVariant fromString(const std::string& utf8);
    static ComVariant fromBool(bool value);
    static ComVariant fromInt(int value);

    VARIANT* get() { return &value_; }
    const VARIANT* get() const { return &value_; }

    /**
     * @brief 转换为UTF-8字符串（VariantChangeType到VT_BSTR）
     */
    std::string toString() const;

    /**
     * @brief 取出 VT_DISPATCH 并增加引用计数，不是对象时返回nullptr
     */
    IDispatch* detachDispatch();

private:
    VARIANT value_;
};

/**
 * @brief IDispatch 智能指针，按名称调用属性和方法
 */
class DispatchPtr {
public:
    DispatchPtr() = default;
    /// 接管一个已经 AddRef 过的指针
    explicit DispatchPtr(IDispatch* dispatch) : ptr_(dispatch) {}
    ~DispatchPtr();

    DispatchPtr(const DispatchPtr&) = delete;
    DispatchPtr& operator=(const DispatchPtr&) = delete;
    DispatchPtr(DispatchPtr&& other) noexcept;
    DispatchPtr& operator=(DispatchPtr&& other) noexcept;

    IDispatch* get() const { return ptr_; }
    explicit operator bool() const { return ptr_ != nullptr; }

    ComVariant getProperty(const wchar_t* name, std::vector<ComVariant> args = {}) const;
    void putProperty(const wchar_t* name, ComVariant value) const;
    ComVariant call(const wchar_t* name, std::vector<ComVariant> args = {}) const;

    /**
     * @brief 读取返回对象的属性或方法（Sheets、UsedRange、PublishObjects.Add等）
     */
    DispatchPtr getObject(const wchar_t* name, std::vector<ComVariant> args = {}) const;

    void reset();

private:
    ComVariant invoke(WORD flags, const wchar_t* name, std::vector<ComVariant>& args) const;

    IDispatch* ptr_ = nullptr;
};

/**
 * @brief 当前线程的COM单线程套间
 */
class ComSession : public IAutomationSession {
public:
    ComSession();
    ~ComSession() override;

private:
    bool should_uninitialize_ = false;
};

class ComApplication : public IApplication {
public:
    explicit ComApplication(DispatchPtr application);

    void setVisible(bool visible) override;
    void setDisplayAlerts(bool display) override;
    void setAskToUpdateLinks(bool ask) override;
    std::unique_ptr<IWorkbookDocument> openWorkbook(const core::Path& path, bool read_only) override;
    RangeReference range(const std::string& address) override;
    void quit() override;

private:
    DispatchPtr application_;
};

class ComWorkbookDocument : public IWorkbookDocument {
public:
    explicit ComWorkbookDocument(DispatchPtr workbook);

    /**
     * @brief 包装调用方已经持有的 Workbook 对象（内部 AddRef）
     */
    static std::unique_ptr<ComWorkbookDocument> attach(IDispatch* workbook);

    std::string getName() const override;
    IApplication& getApplication() override;
    RangeReference usedRange(const std::optional<std::string>& sheet) override;
    void publishHtml(const HtmlPublishRequest& request) override;
    void close(bool save_changes) override;

private:
    DispatchPtr workbook_;
    std::unique_ptr<ComApplication> application_;
};

class ComAutomationBackend : public IAutomationBackend {
public:
    std::unique_ptr<IAutomationSession> createSession() override;
    std::unique_ptr<IApplication> launchApplication() override;
    std::string getTypeName() const override { return "com"; }
};

}} // namespace excelpic::automation

#endif // _WIN32
