#include "excelpic/core/ExcelWorkbook.hpp"
#include "excelpic/core/Exception.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <ios>
#include <utility>

namespace excelpic {
namespace core {

ExcelWorkbook ExcelWorkbook::open(const Path& path, bool read_only,
                                  std::shared_ptr<automation::IAutomationBackend> backend) {
    Path absolute = path.absolute();
    if (!absolute.exists()) {
        WORKBOOK_ERROR("Workbook not found: {}", absolute.string());
        throw FileException("Workbook not found", absolute.string(),
                            ErrorCode::FileNotFound, __FILE__, __LINE__);
    }

    if (!backend) {
        backend = automation::createDefaultBackend();
    }

    // 失败时由 workbook 的析构函数释放已经获取的资源
    ExcelWorkbook workbook;
    workbook.backend_ = std::move(backend);
    workbook.path_ = absolute;

    WORKBOOK_INFO("Opening {} (read_only={}, backend={})", absolute.string(), read_only,
                  workbook.backend_->getTypeName());
    try {
        workbook.session_ = workbook.backend_->createSession();
        workbook.application_ = workbook.backend_->launchApplication();
        workbook.application_->setVisible(false);
        workbook.application_->setDisplayAlerts(false);
        workbook.application_->setAskToUpdateLinks(false);
        workbook.document_ = workbook.application_->openWorkbook(absolute, read_only);
    } catch (const AutomationException& e) {
        WORKBOOK_ERROR("Automation failed while opening {}: {}", absolute.string(), e.what());
        throw;
    } catch (const FileException& e) {
        WORKBOOK_ERROR("I/O error while opening {}: {}", absolute.string(), e.what());
        throw WorkbookOpenException(e.what(), absolute.string(), __FILE__, __LINE__);
    } catch (const std::filesystem::filesystem_error& e) {
        WORKBOOK_ERROR("I/O error while opening {}: {}", absolute.string(), e.what());
        throw WorkbookOpenException(e.what(), absolute.string(), __FILE__, __LINE__);
    } catch (const std::ios_base::failure& e) {
        WORKBOOK_ERROR("I/O error while opening {}: {}", absolute.string(), e.what());
        throw WorkbookOpenException(e.what(), absolute.string(), __FILE__, __LINE__);
    }

    if (!workbook.document_) {
        throw AutomationException("Host returned no document", absolute.string(),
                                  ErrorCode::AutomationError, __FILE__, __LINE__);
    }

    workbook.state_ = WorkbookState::OPEN;
    WORKBOOK_INFO("Workbook opened: {}", absolute.string());
    return workbook;
}

ExcelWorkbook::ExcelWorkbook(automation::IWorkbookDocument& document)
    : borrowed_(&document), state_(WorkbookState::OPEN) {
    WORKBOOK_DEBUG("Wrapping caller-owned workbook");
}

ExcelWorkbook::~ExcelWorkbook() {
    try {
        if (!close()) {
            WORKBOOK_WARN("Workbook {} was not released cleanly", path_.string());
        }
    } catch (const std::exception& e) {
        // 析构函数中不抛出异常
        WORKBOOK_ERROR("Error during workbook destruction: {}", e.what());
    }
}

ExcelWorkbook::ExcelWorkbook(ExcelWorkbook&& other) noexcept
    : backend_(std::move(other.backend_)),
      session_(std::move(other.session_)),
      application_(std::move(other.application_)),
      document_(std::move(other.document_)),
      borrowed_(other.borrowed_),
      path_(std::move(other.path_)),
      state_(other.state_) {
    other.borrowed_ = nullptr;
    other.state_ = WorkbookState::CLOSED;
}

ExcelWorkbook& ExcelWorkbook::operator=(ExcelWorkbook&& other) noexcept {
    if (this != &other) {
        try {
            close();
        } catch (const std::exception& e) {
            WORKBOOK_ERROR("Error closing workbook before move assignment: {}", e.what());
        }
        backend_ = std::move(other.backend_);
        session_ = std::move(other.session_);
        application_ = std::move(other.application_);
        document_ = std::move(other.document_);
        borrowed_ = other.borrowed_;
        path_ = std::move(other.path_);
        state_ = other.state_;
        other.borrowed_ = nullptr;
        other.state_ = WorkbookState::CLOSED;
    }
    return *this;
}

bool ExcelWorkbook::close() {
    // 幂等性检查：避免重复关闭
    if (state_ == WorkbookState::CLOSED) {
        return true;
    }

    bool clean = true;
    if (document_) {
        try {
            document_->close(false);
        } catch (const ExcelPicException& e) {
            WORKBOOK_ERROR("Failed to close document {}: {}", path_.string(), e.what());
            clean = false;
        }
        document_.reset();
    }

    if (application_) {
        try {
            application_->quit();
        } catch (const ExcelPicException& e) {
            WORKBOOK_ERROR("Failed to quit automation host: {}", e.what());
            clean = false;
        }
        application_.reset();
    }

    session_.reset();
    borrowed_ = nullptr;
    state_ = WorkbookState::CLOSED;
    WORKBOOK_DEBUG("Workbook closed: {}", path_.string());
    return clean;
}

automation::IWorkbookDocument& ExcelWorkbook::document() {
    if (document_) {
        return *document_;
    }
    if (borrowed_) {
        return *borrowed_;
    }
    throw ExcelPicException("Workbook is not open", ErrorCode::InvalidArgument, __FILE__, __LINE__);
}

automation::IApplication& ExcelWorkbook::application() {
    if (application_) {
        return *application_;
    }
    return document().getApplication();
}

}} // namespace excelpic::core
