#pragma once

#include <functional>
#include <type_traits>

#include <cxxprelude/task.hpp>
#include <cxxprelude/typeclass.hpp>

namespace prelude {

    template<>
    struct functor<task_tag> {
        template<typename A, typename F>
        static auto map(const task<A>& fa, F f) {
            return fa.map(std::move(f));
        }
    };

    // apply runs the function's task before the value's
    template<>
    struct applicative<task_tag> {
        template<typename A>
        static task<A> pure(A a) {
            return task<A>::pure(std::move(a));
        }

        template<typename FF, typename A>
        static auto apply(const task<FF>& ff, const task<A>& fa) {
            return ff.flatMap([fa](FF f) {
                return fa.map(std::move(f));
            });
        }
    };

    template<>
    struct monad<task_tag> {
        template<typename A, typename F>
        static auto bind(const task<A>& ma, F f) {
            return ma.flatMap(std::move(f));
        }
    };

}
