#ifdef _WIN32

#include "excelpic/automation/ComAutomation.hpp"
#include "excelpic/core/Exception.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <iterator>
#include <utf8.h>

namespace excelpic {
namespace automation {

namespace {

std::wstring toWide(const std::string& utf8) {
    std::wstring wide;
    utf8::utf8to16(utf8.begin(), utf8.end(), std::back_inserter(wide));
    return wide;
}

std::string fromWide(const wchar_t* wide, size_t length) {
    std::string utf8;
    utf8::utf16to8(wide, wide + length, std::back_inserter(utf8));
    return utf8;
}

std::string fromBstr(BSTR value) {
    if (!value) {
        return std::string();
    }
    return fromWide(value, SysStringLen(value));
}

std::string describeHresult(HRESULT hr) {
    return fmt::format("HRESULT 0x{:08X}", static_cast<unsigned long>(hr));
}

/**
 * @brief 组合HRESULT和EXCEPINFO为诊断字符串，并释放EXCEPINFO中的BSTR
 */
std::string describeInvokeFailure(HRESULT hr, EXCEPINFO& info) {
    std::string diagnostic = describeHresult(hr);
    if (hr == DISP_E_EXCEPTION) {
        if (info.pfnDeferredFillIn) {
            info.pfnDeferredFillIn(&info);
        }
        std::string source = fromBstr(info.bstrSource);
        std::string description = fromBstr(info.bstrDescription);
        if (!source.empty()) {
            diagnostic += fmt::format(", source: {}", source);
        }
        if (!description.empty()) {
            diagnostic += fmt::format(", description: {}", description);
        }
        if (info.scode != 0) {
            diagnostic += fmt::format(", scode 0x{:08X}", static_cast<unsigned long>(info.scode));
        }
    }
    SysFreeString(info.bstrSource);
    SysFreeString(info.bstrDescription);
    SysFreeString(info.bstrHelpFile);
    return diagnostic;
}

} // namespace

// ========== ComVariant ==========

ComVariant::ComVariant() {
    VariantInit(&value_);
}

ComVariant::~ComVariant() {
    VariantClear(&value_);
}

ComVariant::ComVariant(const ComVariant& other) {
    VariantInit(&value_);
    HRESULT hr = VariantCopy(&value_, &other.value_);
    if (FAILED(hr)) {
        throw core::AutomationException("Failed to copy VARIANT", describeHresult(hr),
                                        core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }
}

ComVariant& ComVariant::operator=(const ComVariant& other) {
    if (this != &other) {
        HRESULT hr = VariantCopy(&value_, &other.value_);
        if (FAILED(hr)) {
            throw core::AutomationException("Failed to copy VARIANT", describeHresult(hr),
                                            core::ErrorCode::AutomationError, __FILE__, __LINE__);
        }
    }
    return *this;
}

ComVariant::ComVariant(ComVariant&& other) noexcept {
    value_ = other.value_;
    VariantInit(&other.value_);
}

ComVariant& ComVariant::operator=(ComVariant&& other) noexcept {
    if (this != &other) {
        VariantClear(&value_);
        value_ = other.value_;
        VariantInit(&other.value_);
    }
    return *this;
}

ComVariant ComVariant::fromString(const std::string& utf8) {
    ComVariant result;
    std::wstring wide = toWide(utf8);
    result.value_.vt = VT_BSTR;
    result.value_.bstrVal = SysAllocStringLen(wide.data(), static_cast<UINT>(wide.size()));
    if (!result.value_.bstrVal) {
        result.value_.vt = VT_EMPTY;
        throw core::AutomationException("Failed to allocate BSTR", "",
                                        core::ErrorCode::OutOfMemory, __FILE__, __LINE__);
    }
    return result;
}

ComVariant ComVariant::fromBool(bool value) {
    ComVariant result;
    result.value_.vt = VT_BOOL;
    result.value_.boolVal = value ? VARIANT_TRUE : VARIANT_FALSE;
    return result;
}

ComVariant ComVariant::fromInt(int value) {
    ComVariant result;
    result.value_.vt = VT_I4;
    result.value_.lVal = value;
    return result;
}

std::string ComVariant::toString() const {
    if (value_.vt == VT_BSTR) {
        return fromBstr(value_.bstrVal);
    }

    VARIANT converted;
    VariantInit(&converted);
    HRESULT hr = VariantChangeType(&converted, &value_, 0, VT_BSTR);
    if (FAILED(hr)) {
        throw core::AutomationException("Cannot convert automation value to string",
                                        describeHresult(hr),
                                        core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }
    std::string result = fromBstr(converted.bstrVal);
    VariantClear(&converted);
    return result;
}

IDispatch* ComVariant::detachDispatch() {
    if (value_.vt != VT_DISPATCH || !value_.pdispVal) {
        return nullptr;
    }
    IDispatch* dispatch = value_.pdispVal;
    dispatch->AddRef();
    return dispatch;
}

// ========== DispatchPtr ==========

DispatchPtr::~DispatchPtr() {
    reset();
}

DispatchPtr::DispatchPtr(DispatchPtr&& other) noexcept : ptr_(other.ptr_) {
    other.ptr_ = nullptr;
}

DispatchPtr& DispatchPtr::operator=(DispatchPtr&& other) noexcept {
    if (this != &other) {
        reset();
        ptr_ = other.ptr_;
        other.ptr_ = nullptr;
    }
    return *this;
}

void DispatchPtr::reset() {
    if (ptr_) {
        ptr_->Release();
        ptr_ = nullptr;
    }
}

ComVariant DispatchPtr::invoke(WORD flags, const wchar_t* name, std::vector<ComVariant>& args) const {
    const std::string member = fromWide(name, wcslen(name));
    if (!ptr_) {
        throw core::AutomationException(fmt::format("Cannot access '{}' on a released object", member),
                                        "", core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }

    DISPID dispid = 0;
    LPOLESTR names[] = {const_cast<LPOLESTR>(name)};
    HRESULT hr = ptr_->GetIDsOfNames(IID_NULL, names, 1, LOCALE_USER_DEFAULT, &dispid);
    if (FAILED(hr)) {
        AUTOMATION_ERROR("GetIDsOfNames({}) failed: {}", member, describeHresult(hr));
        throw core::AutomationException(fmt::format("Unknown automation member '{}'", member),
                                        describeHresult(hr),
                                        core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }

    // IDispatch 的位置参数按逆序传递
    std::vector<VARIANT> reversed;
    reversed.reserve(args.size());
    for (auto it = args.rbegin(); it != args.rend(); ++it) {
        reversed.push_back(*it->get());
    }

    DISPPARAMS params{};
    params.rgvarg = reversed.empty() ? nullptr : reversed.data();
    params.cArgs = static_cast<UINT>(reversed.size());

    DISPID put_id = DISPID_PROPERTYPUT;
    if (flags & DISPATCH_PROPERTYPUT) {
        params.rgdispidNamedArgs = &put_id;
        params.cNamedArgs = 1;
    }

    ComVariant result;
    EXCEPINFO info{};
    UINT arg_error = 0;
    hr = ptr_->Invoke(dispid, IID_NULL, LOCALE_USER_DEFAULT, flags, &params,
                      (flags & DISPATCH_PROPERTYPUT) ? nullptr : result.get(),
                      &info, &arg_error);
    if (FAILED(hr)) {
        std::string diagnostic = describeInvokeFailure(hr, info);
        AUTOMATION_ERROR("Invoke({}) failed: {}", member, diagnostic);
        throw core::AutomationException(fmt::format("Automation call '{}' failed", member),
                                        diagnostic,
                                        core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }
    return result;
}

ComVariant DispatchPtr::getProperty(const wchar_t* name, std::vector<ComVariant> args) const {
    return invoke(DISPATCH_PROPERTYGET, name, args);
}

void DispatchPtr::putProperty(const wchar_t* name, ComVariant value) const {
    std::vector<ComVariant> args;
    args.push_back(std::move(value));
    invoke(DISPATCH_PROPERTYPUT, name, args);
}

ComVariant DispatchPtr::call(const wchar_t* name, std::vector<ComVariant> args) const {
    return invoke(DISPATCH_METHOD, name, args);
}

DispatchPtr DispatchPtr::getObject(const wchar_t* name, std::vector<ComVariant> args) const {
    ComVariant value = invoke(DISPATCH_METHOD | DISPATCH_PROPERTYGET, name, args);
    IDispatch* dispatch = value.detachDispatch();
    if (!dispatch) {
        throw core::AutomationException(
            fmt::format("Automation member '{}' did not return an object", fromWide(name, wcslen(name))),
            "", core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }
    return DispatchPtr(dispatch);
}

// ========== ComSession ==========

ComSession::ComSession() {
    HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    if (SUCCEEDED(hr)) {
        should_uninitialize_ = true;
        AUTOMATION_DEBUG("COM initialized for current thread");
    } else if (hr == RPC_E_CHANGED_MODE) {
        // 线程已经处于其他套间模式，沿用即可，但不负责清理
        AUTOMATION_DEBUG("COM already initialized with a different concurrency model");
    } else {
        throw core::AutomationException("CoInitializeEx failed", describeHresult(hr),
                                        core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }
}

ComSession::~ComSession() {
    if (should_uninitialize_) {
        CoUninitialize();
        AUTOMATION_DEBUG("COM uninitialized for current thread");
    }
}

// ========== ComApplication ==========

ComApplication::ComApplication(DispatchPtr application)
    : application_(std::move(application)) {}

void ComApplication::setVisible(bool visible) {
    application_.putProperty(L"Visible", ComVariant::fromBool(visible));
}

void ComApplication::setDisplayAlerts(bool display) {
    application_.putProperty(L"DisplayAlerts", ComVariant::fromBool(display));
}

void ComApplication::setAskToUpdateLinks(bool ask) {
    application_.putProperty(L"AskToUpdateLinks", ComVariant::fromBool(ask));
}

std::unique_ptr<IWorkbookDocument> ComApplication::openWorkbook(const core::Path& path, bool read_only) {
    AUTOMATION_DEBUG("Workbooks.Open({}, UpdateLinks=0, ReadOnly={})", path.string(), read_only);
    DispatchPtr workbooks = application_.getObject(L"Workbooks");

    std::vector<ComVariant> args;
    args.push_back(ComVariant::fromString(path.string()));
    args.push_back(ComVariant::fromInt(0));
    args.push_back(ComVariant::fromBool(read_only));
    return std::make_unique<ComWorkbookDocument>(workbooks.getObject(L"Open", std::move(args)));
}

RangeReference ComApplication::range(const std::string& address) {
    std::vector<ComVariant> args;
    args.push_back(ComVariant::fromString(address));
    DispatchPtr range = application_.getObject(L"Range", std::move(args));

    RangeReference reference;
    reference.sheet_name = range.getObject(L"Worksheet").getProperty(L"Name").toString();
    reference.address = range.getProperty(L"Address").toString();
    return reference;
}

void ComApplication::quit() {
    application_.call(L"Quit");
    application_.reset();
}

// ========== ComWorkbookDocument ==========

ComWorkbookDocument::ComWorkbookDocument(DispatchPtr workbook)
    : workbook_(std::move(workbook)) {
    application_ = std::make_unique<ComApplication>(workbook_.getObject(L"Application"));
}

std::unique_ptr<ComWorkbookDocument> ComWorkbookDocument::attach(IDispatch* workbook) {
    if (!workbook) {
        throw core::ParameterException("Workbook object is null", "workbook", __FILE__, __LINE__);
    }
    workbook->AddRef();
    return std::make_unique<ComWorkbookDocument>(DispatchPtr(workbook));
}

std::string ComWorkbookDocument::getName() const {
    return workbook_.getProperty(L"Name").toString();
}

IApplication& ComWorkbookDocument::getApplication() {
    return *application_;
}

RangeReference ComWorkbookDocument::usedRange(const std::optional<std::string>& sheet) {
    DispatchPtr sheets = workbook_.getObject(L"Sheets");

    std::vector<ComVariant> args;
    args.push_back(sheet ? ComVariant::fromString(*sheet) : ComVariant::fromInt(1));
    DispatchPtr worksheet = sheets.getObject(L"Item", std::move(args));
    DispatchPtr used = worksheet.getObject(L"UsedRange");

    RangeReference reference;
    reference.sheet_name = worksheet.getProperty(L"Name").toString();
    reference.address = used.getProperty(L"Address").toString();
    return reference;
}

void ComWorkbookDocument::publishHtml(const HtmlPublishRequest& request) {
    AUTOMATION_DEBUG("PublishObjects.Add({}, {}, {}, {}, {})", request.source_type,
                     request.filename.string(), request.sheet_name, request.source, request.html_type);
    DispatchPtr publish_objects = workbook_.getObject(L"PublishObjects");

    std::vector<ComVariant> args;
    args.push_back(ComVariant::fromInt(request.source_type));
    args.push_back(ComVariant::fromString(request.filename.string()));
    args.push_back(ComVariant::fromString(request.sheet_name));
    args.push_back(ComVariant::fromString(request.source));
    args.push_back(ComVariant::fromInt(request.html_type));
    DispatchPtr publish_object = publish_objects.getObject(L"Add", std::move(args));

    std::vector<ComVariant> publish_args;
    publish_args.push_back(ComVariant::fromBool(true));
    publish_object.call(L"Publish", std::move(publish_args));
}

void ComWorkbookDocument::close(bool save_changes) {
    std::vector<ComVariant> args;
    args.push_back(ComVariant::fromBool(save_changes));
    workbook_.call(L"Close", std::move(args));
    workbook_.reset();
}

// ========== ComAutomationBackend ==========

std::unique_ptr<IAutomationSession> ComAutomationBackend::createSession() {
    return std::make_unique<ComSession>();
}

std::unique_ptr<IApplication> ComAutomationBackend::launchApplication() {
    CLSID clsid;
    HRESULT hr = CLSIDFromProgID(L"Excel.Application", &clsid);
    if (FAILED(hr)) {
        AUTOMATION_ERROR("Excel.Application is not registered: {}", describeHresult(hr));
        throw core::AutomationException("Excel.Application is not registered", describeHresult(hr),
                                        core::ErrorCode::AutomationUnavailable, __FILE__, __LINE__);
    }

    IDispatch* dispatch = nullptr;
    hr = CoCreateInstance(clsid, nullptr, CLSCTX_LOCAL_SERVER, IID_IDispatch,
                          reinterpret_cast<void**>(&dispatch));
    if (FAILED(hr) || !dispatch) {
        AUTOMATION_ERROR("CoCreateInstance(Excel.Application) failed: {}", describeHresult(hr));
        throw core::AutomationException("Cannot launch Excel.Application", describeHresult(hr),
                                        core::ErrorCode::AutomationError, __FILE__, __LINE__);
    }

    AUTOMATION_INFO("Excel.Application launched");
    return std::make_unique<ComApplication>(DispatchPtr(dispatch));
}

}} // namespace excelpic::automation

#endif // _WIN32
