#include "excelpic/automation/AutomationHost.hpp"
#include "excelpic/automation/UnavailableBackend.hpp"
#include "excelpic/core/Exception.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"

#ifdef _WIN32
#include "excelpic/automation/ComAutomation.hpp"
#endif

namespace excelpic {
namespace automation {

namespace {

class NullSession : public IAutomationSession {};

} // namespace

std::unique_ptr<IAutomationSession> UnavailableAutomationBackend::createSession() {
    return std::make_unique<NullSession>();
}

std::unique_ptr<IApplication> UnavailableAutomationBackend::launchApplication() {
    AUTOMATION_ERROR("No spreadsheet automation host on this platform");
    throw core::AutomationException("Cannot launch Excel.Application",
                                    "spreadsheet automation is only available on Windows",
                                    core::ErrorCode::AutomationUnavailable,
                                    __FILE__, __LINE__);
}

std::shared_ptr<IAutomationBackend> createDefaultBackend() {
#ifdef _WIN32
    return std::make_shared<ComAutomationBackend>();
#else
    return std::make_shared<UnavailableAutomationBackend>();
#endif
}

}} // namespace excelpic::automation
