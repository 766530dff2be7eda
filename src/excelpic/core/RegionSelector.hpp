#pragma once

#include <optional>
#include <string>
#include <utility>

namespace excelpic {
namespace core {

/**
 * @brief 要导出的区域：工作表名称和地址表达式，两者都可以省略
 *
 * - 没有地址：导出工作表的已用区域（没有工作表名称时取第一个工作表）
 * - 有地址：按应用级别解析，支持命名区域和 "Sheet2!B2" 这类跨表引用
 */
struct RegionSelector {
    std::optional<std::string> page;
    std::optional<std::string> address;

    RegionSelector() = default;
    RegionSelector(std::optional<std::string> page_name, std::optional<std::string> address_expr)
        : page(std::move(page_name)), address(std::move(address_expr)) {}

    bool hasAddress() const { return address.has_value() && !address->empty(); }
    bool hasPage() const { return page.has_value() && !page->empty(); }

    /**
     * @brief 用工作表名称限定地址
     *
     * 地址不含 '!' 且给出了工作表名称时返回 'Page'!Address，
     * 否则原样返回地址（含 '!' 时忽略工作表名称）。
     * @return 没有地址时返回空字符串
     */
    std::string qualifiedAddress() const;
};

}} // namespace excelpic::core
