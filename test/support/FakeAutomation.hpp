#pragma once

#include "excelpic/automation/AutomationHost.hpp"
#include "excelpic/core/Exception.hpp"
#include "excelpic/utils/FileWrapper.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace excelpic {
namespace test {

/**
 * @brief 测试用宿主的共享状态：记录调用并控制故障注入
 */
struct FakeHostState {
    // 计数
    int sessions_created = 0;
    int sessions_alive = 0;
    int applications_launched = 0;
    int applications_quit = 0;
    int documents_opened = 0;
    int documents_closed = 0;

    // 最近一次调用的参数
    std::string last_open_path;
    bool last_read_only = false;
    bool last_save_changes = true;
    std::optional<bool> visible;
    std::optional<bool> display_alerts;
    std::optional<bool> ask_to_update_links;
    std::vector<std::string> range_requests;
    std::vector<std::optional<std::string>> used_range_requests;
    std::vector<automation::HtmlPublishRequest> publish_requests;

    // 工作簿内容
    std::vector<std::string> sheets{"Sheet1"};
    std::string used_range = "$A$1:$C$3";
    std::map<std::string, automation::RangeReference> named_ranges;
    std::string html = "<html><head><meta charset=\"utf-8\"><style>td { color: black; }</style>"
                       "</head><body><table><tr><td>1</td></tr></table></body></html>";

    // 故障注入
    bool fail_launch = false;
    bool fail_open = false;
    bool fail_open_io = false;
    bool fail_publish = false;
    bool publish_writes_file = true;
    bool fail_close = false;
};

class FakeDocument : public automation::IWorkbookDocument {
public:
    FakeDocument(std::shared_ptr<FakeHostState> state, automation::IApplication& application, std::string name)
        : state_(std::move(state)), application_(application), name_(std::move(name)) {}

    std::string getName() const override { return name_; }

    automation::IApplication& getApplication() override { return application_; }

    automation::RangeReference usedRange(const std::optional<std::string>& sheet) override {
        state_->used_range_requests.push_back(sheet);
        std::string sheet_name = sheet ? *sheet : state_->sheets.front();
        bool known = false;
        for (const auto& s : state_->sheets) {
            known = known || s == sheet_name;
        }
        if (!known) {
            throw core::AutomationException("Sheets.Item failed", "HRESULT 0x8002000B",
                                            core::ErrorCode::AutomationError);
        }
        return automation::RangeReference{sheet_name, state_->used_range};
    }

    void publishHtml(const automation::HtmlPublishRequest& request) override {
        state_->publish_requests.push_back(request);
        if (state_->fail_publish) {
            throw core::AutomationException("PublishObjects.Add failed", "HRESULT 0x800A03EC",
                                            core::ErrorCode::AutomationError);
        }
        if (state_->publish_writes_file) {
            utils::FileWrapper::writeFile(request.filename, state_->html);
        }
    }

    void close(bool save_changes) override {
        state_->last_save_changes = save_changes;
        ++state_->documents_closed;
        if (state_->fail_close) {
            throw core::AutomationException("Workbook.Close failed", "HRESULT 0x80010108",
                                            core::ErrorCode::AutomationError);
        }
    }

private:
    std::shared_ptr<FakeHostState> state_;
    automation::IApplication& application_;
    std::string name_;
};

class FakeApplication : public automation::IApplication {
public:
    explicit FakeApplication(std::shared_ptr<FakeHostState> state) : state_(std::move(state)) {}

    void setVisible(bool visible) override { state_->visible = visible; }
    void setDisplayAlerts(bool display) override { state_->display_alerts = display; }
    void setAskToUpdateLinks(bool ask) override { state_->ask_to_update_links = ask; }

    std::unique_ptr<automation::IWorkbookDocument> openWorkbook(const core::Path& path, bool read_only) override {
        state_->last_open_path = path.string();
        state_->last_read_only = read_only;
        if (state_->fail_open) {
            throw core::AutomationException("Workbooks.Open failed", "HRESULT 0x800A03EC",
                                            core::ErrorCode::AutomationError);
        }
        if (state_->fail_open_io) {
            throw core::FileException("Cannot read workbook", path.string(), core::ErrorCode::FileReadError);
        }
        ++state_->documents_opened;
        return std::make_unique<FakeDocument>(state_, *this, path.filename());
    }

    automation::RangeReference range(const std::string& address) override {
        state_->range_requests.push_back(address);

        auto named = state_->named_ranges.find(address);
        if (named != state_->named_ranges.end()) {
            return named->second;
        }

        size_t bang = address.find('!');
        if (bang == std::string::npos) {
            return automation::RangeReference{state_->sheets.front(), address};
        }
        std::string sheet = address.substr(0, bang);
        if (sheet.size() >= 2 && sheet.front() == '\'' && sheet.back() == '\'') {
            sheet = sheet.substr(1, sheet.size() - 2);
        }
        return automation::RangeReference{sheet, address.substr(bang + 1)};
    }

    void quit() override { ++state_->applications_quit; }

private:
    std::shared_ptr<FakeHostState> state_;
};

class FakeSession : public automation::IAutomationSession {
public:
    explicit FakeSession(std::shared_ptr<FakeHostState> state) : state_(std::move(state)) {
        ++state_->sessions_created;
        ++state_->sessions_alive;
    }
    ~FakeSession() override { --state_->sessions_alive; }

private:
    std::shared_ptr<FakeHostState> state_;
};

class FakeAutomationBackend : public automation::IAutomationBackend {
public:
    FakeAutomationBackend() : state_(std::make_shared<FakeHostState>()) {}

    std::unique_ptr<automation::IAutomationSession> createSession() override {
        return std::make_unique<FakeSession>(state_);
    }

    std::unique_ptr<automation::IApplication> launchApplication() override {
        if (state_->fail_launch) {
            throw core::AutomationException("Cannot launch Excel.Application", "HRESULT 0x80080005",
                                            core::ErrorCode::AutomationError);
        }
        ++state_->applications_launched;
        return std::make_unique<FakeApplication>(state_);
    }

    std::string getTypeName() const override { return "fake"; }

    FakeHostState& state() { return *state_; }

private:
    std::shared_ptr<FakeHostState> state_;
};

}} // namespace excelpic::test
