#pragma once

#include <functional>

#define RUNEXEC_DEFER_1(x, y) x##y
#define RUNEXEC_DEFER_2(x, y) RUNEXEC_DEFER_1(x, y)
#define RUNEXEC_DEFER_0(x) RUNEXEC_DEFER_2(x, __COUNTER__)
#define defer auto RUNEXEC_DEFER_0(_defered_option) = runexec::scoped_guard() + [&]

namespace runexec {

/**
 * @brief 作用域结束时执行回调
 * 通过 defer { ... }; 使用，可以调用 dismiss() 取消回调
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    void dismiss();
};

}  // namespace runexec
