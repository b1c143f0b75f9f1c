#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = executor::scoped_guard() + [&]

namespace executor {

/**
 * @brief 作用域守卫，离开作用域时执行回调
 * 用于保证工作目录、临时文件在任何返回路径（包括异常）下都被清理。
 * 回调中不应该抛出异常，因为回调在析构函数中执行。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace executor
