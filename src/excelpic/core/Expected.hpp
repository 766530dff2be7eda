#pragma once

#include "excelpic/core/ErrorCode.hpp"
#include <utility>
#include <new>

namespace excelpic {
namespace core {

/**
 * @brief Expected<T, E> - 导出流程各阶段的统一返回类型
 *
 * 成功时携带值，失败时携带 Error。调用方总能以编程方式区分
 * 成功与失败，不依赖日志或输出文件是否存在。
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

public:
    using value_type = T;
    using error_type = E;

    // ========== 构造函数 ==========

    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    // ========== 赋值操作符 ==========

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(other.value_);
            } else {
                new(&error_) E(other.error_);
            }
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(std::move(other.value_));
            } else {
                new(&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问 ==========

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

private:
    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }
};

/**
 * @brief 特化：void类型的Expected
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : has_value_(true) {}

    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

/**
 * @brief 创建成功的 VoidResult
 */
inline VoidResult success() {
    return VoidResult();
}

}} // namespace excelpic::core
