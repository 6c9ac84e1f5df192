#pragma once

#include <functional>
#include <type_traits>

#include <cxxprelude/prelude.hpp>
#include <cxxprelude/typeclass.hpp>

namespace prelude {

    template<>
    struct functor<identity_tag> {
        template<typename A, typename F>
        static auto map(const identity<A>& fa, F f) {
            return identity<std::invoke_result_t<F, const A&>>{std::invoke(f, fa.value)};
        }
    };

    template<>
    struct applicative<identity_tag> {
        template<typename A>
        static identity<A> pure(A a) {
            return identity<A>{std::move(a)};
        }

        template<typename FF, typename A>
        static auto apply(const identity<FF>& ff, const identity<A>& fa) {
            return identity<std::invoke_result_t<const FF&, const A&>>{std::invoke(ff.value, fa.value)};
        }
    };

    template<>
    struct monad<identity_tag> {
        template<typename A, typename F>
        static auto bind(const identity<A>& ma, F f) {
            return std::invoke(f, ma.value);
        }
    };

    template<>
    struct traversable<identity_tag> {
        template<typename GTag, typename A, typename F>
        static auto traverse(const identity<A>& ta, F f) {
            using B = value_of_t<std::invoke_result_t<F, const A&>>;
            return functor<GTag>::map(std::invoke(f, ta.value), [](const B& b) {
                return identity<B>{b};
            });
        }
    };

}
