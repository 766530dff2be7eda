#include "excelpic/render/RenderOptions.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace excelpic {
namespace render {

RenderOptions RenderOptions::defaults() {
    RenderOptions options;
    options.set("format", "png");
    options.set("quality", 100);
    options.set("zoom", 4);
    return options;
}

RenderOptions& RenderOptions::set(const std::string& name, Value value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const Entry& entry) { return entry.first == name; });
    if (it != entries_.end()) {
        it->second = std::move(value);
    } else {
        entries_.emplace_back(name, std::move(value));
    }
    return *this;
}

bool RenderOptions::contains(const std::string& name) const {
    return get(name).has_value();
}

std::optional<RenderOptions::Value> RenderOptions::get(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    return std::nullopt;
}

bool RenderOptions::remove(const std::string& name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const Entry& entry) { return entry.first == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::string RenderOptions::valueToString(const Value& value) {
    if (std::holds_alternative<std::string>(value)) {
        return std::get<std::string>(value);
    }
    if (std::holds_alternative<int64_t>(value)) {
        return fmt::format("{}", std::get<int64_t>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return fmt::format("{}", std::get<double>(value));
    }
    return std::string();
}

std::vector<std::string> RenderOptions::toArguments() const {
    std::vector<std::string> args;
    args.reserve(entries_.size() * 2);
    for (const auto& entry : entries_) {
        args.push_back("--" + entry.first);
        if (!std::holds_alternative<std::monostate>(entry.second)) {
            args.push_back(valueToString(entry.second));
        }
    }
    return args;
}

}} // namespace excelpic::render
