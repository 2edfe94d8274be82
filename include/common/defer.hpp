#pragma once

#include <functional>

/**
 * @brief 作用域守卫，析构时调用回调函数
 * 可以通过 dismiss 取消回调，比如资源的所有权已经转移给别的对象时
 * @code{.cpp}
 *     scoped_guard reaper([&] { child.terminate(); });
 *     prepare(child);
 *     reaper.dismiss();
 * @endcode
 */
struct scoped_guard {
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    /**
     * @brief 取消析构时的回调
     */
    void dismiss() noexcept;

private:
    std::function<void()> f;
};
