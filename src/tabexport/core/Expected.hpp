#pragma once

#include "tabexport/core/ErrorCode.hpp"
#include <utility>
#include <new>

namespace tabexport {
namespace core {

/**
 * @brief 值或错误二选一的返回类型
 *
 * 用于失败属于正常分支的场合：追加模式下目标文件可能尚不存在，
 * 或者是其他程序写出的无法解析的文件。调用方根据 hasValue() 决定回退路径。
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool ok_;

    void reset() noexcept {
        if (ok_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    template<typename Other>
    void adopt(Other&& other) {
        ok_ = other.ok_;
        if (ok_) {
            new(&value_) T(std::forward<Other>(other).value_);
        } else {
            new(&error_) E(std::forward<Other>(other).error_);
        }
    }

public:
    Expected(T value) : ok_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(E error) : ok_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) { adopt(other); }
    Expected(Expected&& other) noexcept { adopt(std::move(other)); }

    ~Expected() { reset(); }

    Expected& operator=(Expected other) noexcept {
        reset();
        adopt(std::move(other));
        return *this;
    }

    bool hasValue() const noexcept { return ok_; }
    explicit operator bool() const noexcept { return ok_; }

    // 调用前须确认 hasValue()
    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    // 调用前须确认 !hasValue()
    const E& error() const noexcept { return error_; }
};

template<typename T>
using Result = Expected<T, Error>;

}} // namespace tabexport::core
