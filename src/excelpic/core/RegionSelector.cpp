#include "excelpic/core/RegionSelector.hpp"
#include <fmt/format.h>

namespace excelpic {
namespace core {

std::string RegionSelector::qualifiedAddress() const {
    if (!hasAddress()) {
        return std::string();
    }
    if (hasPage() && address->find('!') == std::string::npos) {
        return fmt::format("'{}'!{}", *page, *address);
    }
    return *address;
}

}} // namespace excelpic::core
