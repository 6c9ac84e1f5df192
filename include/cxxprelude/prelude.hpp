#pragma once

#include <compare>
#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace prelude {

    // The type with exactly one value. Effects that produce nothing
    // interesting produce a unit.
    struct unit {
        constexpr bool operator==(const unit&) const = default;
        constexpr auto operator<=>(const unit&) const = default;
    };

    template<typename A>
    struct identity {
        A value;

        bool operator==(const identity&) const = default;
    };

    template<typename A>
    identity(A) -> identity<A>;

    // Turns f(a, b) into f(a)(b)
    template<typename F>
    auto curry2(F f) {
        return [f](auto a) {
            return [f, a](auto b) { return std::invoke(f, a, b); };
        };
    }

    // Turns f(a, b, c) into f(a)(b)(c)
    template<typename F>
    auto curry3(F f) {
        return [f](auto a) {
            return [f, a](auto b) {
                return [f, a, b](auto c) { return std::invoke(f, a, b, c); };
            };
        };
    }

    namespace detail {
        // Calls f, mapping a void result onto unit
        template<typename F, typename... Args>
        auto invoke_unit(F&& f, Args&&... args) {
            if constexpr (std::is_void_v<std::invoke_result_t<F, Args...>>) {
                std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
                return unit{};
            } else {
                return std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
            }
        }

        template<typename F, typename... Args>
        using invoke_unit_t = decltype(invoke_unit(std::declval<F>(), std::declval<Args>()...));

        // None arms may take a unit or nothing at all. Either way the
        // result is called with no arguments.
        template<typename F>
        auto nullary(F f) {
            if constexpr (std::invocable<const F&, unit>) {
                return [f]() { return std::invoke(f, unit{}); };
            } else {
                return f;
            }
        }

        // As nullary, for arms that also receive a fold state
        template<typename S, typename F>
        auto stateful(F f) {
            if constexpr (std::invocable<const F&, S, unit>) {
                return [f](S s) { return std::invoke(f, std::move(s), unit{}); };
            } else {
                return f;
            }
        }
    }

}
