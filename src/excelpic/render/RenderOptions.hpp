#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace excelpic {
namespace render {

/**
 * @brief 渲染器选项：有序的 名称 -> 标量 映射
 *
 * 值可以是字符串、整数、浮点数，或者没有值的开关（std::monostate，
 * 只输出 --name）。插入顺序即命令行参数顺序，重复设置同名选项时
 * 替换原值、保留原位置。
 */
class RenderOptions {
public:
    using Value = std::variant<std::monostate, std::string, int64_t, double>;
    using Entry = std::pair<std::string, Value>;

    RenderOptions() = default;

    /**
     * @brief 默认选项：format=png, quality=100, zoom=4
     */
    static RenderOptions defaults();

    RenderOptions& set(const std::string& name, Value value);
    RenderOptions& set(const std::string& name, const char* value) { return set(name, Value(std::string(value))); }
    RenderOptions& set(const std::string& name, int value) { return set(name, Value(static_cast<int64_t>(value))); }
    RenderOptions& set(const std::string& name, int64_t value) { return set(name, Value(value)); }
    RenderOptions& set(const std::string& name, double value) { return set(name, Value(value)); }
    RenderOptions& setFlag(const std::string& name) { return set(name, Value(std::monostate{})); }

    bool contains(const std::string& name) const;
    std::optional<Value> get(const std::string& name) const;
    bool remove(const std::string& name);

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief 转换为渲染器命令行参数：--name value（开关只有 --name）
     */
    std::vector<std::string> toArguments() const;

    static std::string valueToString(const Value& value);

    bool operator==(const RenderOptions& other) const { return entries_ == other.entries_; }
    bool operator!=(const RenderOptions& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

}} // namespace excelpic::render
