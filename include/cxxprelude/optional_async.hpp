#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

#include <cxxprelude/kind.hpp>
#include <cxxprelude/option.hpp>
#include <cxxprelude/prelude.hpp>
#include <cxxprelude/task.hpp>
#include <cxxprelude/typeclass.hpp>

// Operations on any optional value whose state is only known once a task
// completes. They are written against optional_async<Tag>, which supplies
// match, toOption and fromTask, so every such type gets them for free.
//
// Callbacks may return either a plain value or a task of one; both are
// awaited the same way.

namespace prelude {

    template<higher_kinded MA, typename FS, typename FN>
    auto matchAsync(const MA& ma, FS onSome, FN onNone) {
        return optional_async<tag_of_t<MA>>::match(ma, std::move(onSome), std::move(onNone));
    }

    template<higher_kinded MA, typename F>
    task<unit> ifSomeAsync(const MA& ma, F f) {
        using A = value_of_t<MA>;
        return matchAsync(ma,
            [f](const A& a) { return to_unit_task(detail::invoke_unit(f, a)); },
            []() { return unit{}; });
    }

    // fallback is a value, a thunk, or a thunk returning a task. Anything
    // convertible to the bound type is taken as a value.
    template<higher_kinded MA, typename F>
    task<value_of_t<MA>> ifNoneAsync(const MA& ma, F fallback) {
        using A = value_of_t<MA>;
        if constexpr (std::is_convertible_v<F, A>) {
            return matchAsync(ma, detail::identity_fn{}, [fallback]() { return A(fallback); });
        } else {
            return matchAsync(ma, detail::identity_fn{}, std::move(fallback));
        }
    }

    // True for None
    template<higher_kinded MA, typename P>
    task<bool> forAllAsync(const MA& ma, P pred) {
        return matchAsync(ma, std::move(pred), []() { return true; });
    }

    // False for None
    template<higher_kinded MA, typename P>
    task<bool> existsAsync(const MA& ma, P pred) {
        return matchAsync(ma, std::move(pred), []() { return false; });
    }

    template<higher_kinded MA, typename PS, typename PN>
    task<bool> biForAllAsync(const MA& ma, PS onSome, PN onNone) {
        return matchAsync(ma, std::move(onSome), detail::nullary(std::move(onNone)));
    }

    template<higher_kinded MA, typename PS, typename PN>
    task<bool> biExistsAsync(const MA& ma, PS onSome, PN onNone) {
        return matchAsync(ma, std::move(onSome), detail::nullary(std::move(onNone)));
    }

    template<higher_kinded MA, typename FS, typename FN>
    task<unit> biIterAsync(const MA& ma, FS onSome, FN onNone) {
        using A = value_of_t<MA>;
        auto none = detail::nullary(std::move(onNone));
        return matchAsync(ma,
            [onSome](const A& a) { return to_unit_task(detail::invoke_unit(onSome, a)); },
            [none]() { return to_unit_task(detail::invoke_unit(none)); });
    }

    // pred may answer with a bool or a task<bool>
    template<higher_kinded MA, typename P>
    MA filterAsync(const MA& ma, P pred) {
        using A = value_of_t<MA>;
        using instance = optional_async<tag_of_t<MA>>;
        return instance::fromTask(matchAsync(ma,
            [pred](const A& a) {
                return to_task(std::invoke(pred, a)).map([a](bool keep) {
                    return keep ? option<A>(a) : option<A>();
                });
            },
            []() { return option<A>(); }));
    }

    // lhs if it turns out to be Some, otherwise rhs
    template<higher_kinded MA>
    MA plusAsync(const MA& lhs, const MA& rhs) {
        using A = value_of_t<MA>;
        using instance = optional_async<tag_of_t<MA>>;
        return instance::fromTask(matchAsync(lhs,
            [](const A& a) { return option<A>(a); },
            [rhs]() { return instance::toOption(rhs); }));
    }

    // Some(project(a, b)) when both sides are Some and their keys agree
    template<higher_kinded MA, higher_kinded MB, typename KA, typename KB, typename P>
    auto joinAsync(const MA& outer, const MB& inner, KA outerKey, KB innerKey, P project) {
        using A = value_of_t<MA>;
        using B = value_of_t<MB>;
        return monad<tag_of_t<MA>>::bind(outer, [inner, outerKey, innerKey, project](const A& a) {
            auto key = std::invoke(outerKey, a);
            auto matching = filterAsync(inner, [key, innerKey](const B& b) {
                return std::invoke(innerKey, b) == key;
            });
            return functor<tag_of_t<MB>>::map(matching, [a, project](const B& b) {
                return std::invoke(project, a, b);
            });
        });
    }

}
