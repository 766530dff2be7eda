#pragma once

#include "excelpic/automation/AutomationHost.hpp"

namespace excelpic {
namespace automation {

/**
 * @brief 没有自动化宿主的平台使用的后端
 *
 * 会话可以正常创建，启动宿主时抛出 AutomationException。
 */
class UnavailableAutomationBackend : public IAutomationBackend {
public:
    std::unique_ptr<IAutomationSession> createSession() override;
    std::unique_ptr<IApplication> launchApplication() override;
    std::string getTypeName() const override { return "unavailable"; }
};

}} // namespace excelpic::automation
