//
// Created by ubuntu on 2025/11/5.
//

#ifndef COURIER_FINALLY_HPP
#define COURIER_FINALLY_HPP
#include <type_traits>
#include <utility>

namespace courier {

/**
 * @brief 作用域退出时执行清理动作的 RAII guard。
 *
 * 清理动作必须是 noexcept 的：析构函数本身是 noexcept，
 * 抛出的异常会直接导致 std::terminate()。
 */
template<typename Func>
struct [[nodiscard]] Finally {
    static_assert(std::is_nothrow_invocable_v<Func>, "Finally 的清理动作必须是 noexcept 的");

    Func func;
    bool active = true;

    explicit Finally(Func f) noexcept : func(std::move(f)) {}

    // 移动构造函数，用于转移所有权
    Finally(Finally&& other) noexcept : func(std::move(other.func)), active(other.active) {
        other.active = false;
    }

    ~Finally() noexcept {
        if (active) {
            func();
        }
    }

    // 解除 guard，清理动作不再执行
    void disarm() noexcept {
        active = false;
    }

    Finally(const Finally&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally& operator=(Finally&&) = delete;
};

template<typename Func>
[[nodiscard]] auto make_finally(Func&& f) {
    return Finally<std::decay_t<Func>>(std::forward<Func>(f));
}

} // namespace courier
#endif //COURIER_FINALLY_HPP
