#pragma once

#include <functional>

#define GRADER_DEFER_1(x, y) x##y
#define GRADER_DEFER_2(x, y) GRADER_DEFER_1(x, y)
#define GRADER_DEFER_0(x) GRADER_DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行一段代码
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto GRADER_DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 作用域守卫，析构时调用回调函数
 * 回调函数抛出的异常会被记录下来，不会从析构函数中传播出去
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace grader
