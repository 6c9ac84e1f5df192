#pragma once

#include <functional>
#include <type_traits>

#include <cxxprelude/option.hpp>
#include <cxxprelude/typeclass.hpp>

namespace prelude {

    template<>
    struct functor<option_tag> {
        template<typename A, typename F>
        static auto map(const option<A>& fa, F f) {
            return fa.map(std::move(f));
        }
    };

    template<>
    struct applicative<option_tag> {
        template<typename A>
        static option<A> pure(A a) {
            return option<A>(std::move(a));
        }

        template<typename FF, typename A>
        static auto apply(const option<FF>& ff, const option<A>& fa)
            -> option<std::invoke_result_t<const FF&, const A&>> {
            using B = std::invoke_result_t<const FF&, const A&>;
            if(ff.isNone() || fa.isNone()) return option<B>();
            return option<B>(std::invoke(ff.value(), fa.value()));
        }
    };

    template<>
    struct monad<option_tag> {
        template<typename A, typename F>
        static auto bind(const option<A>& ma, F f) {
            return ma.flatMap(std::move(f));
        }
    };

    template<>
    struct foldable<option_tag> {
        template<typename A, typename S, typename F>
        static S fold(const option<A>& fa, S state, F folder) {
            return fa.fold(std::move(state), std::move(folder));
        }

        template<typename A, typename S, typename F>
        static S foldBack(const option<A>& fa, S state, F folder) {
            return fa.foldBack(std::move(state), std::move(folder));
        }

        template<typename A>
        static int count(const option<A>& fa) {
            return fa.count();
        }
    };

    // None becomes G's pure None; Some(a) becomes f(a) with Some mapped
    // over its result
    template<>
    struct traversable<option_tag> {
        template<typename GTag, typename A, typename F>
        static auto traverse(const option<A>& ta, F f) {
            using B = value_of_t<std::invoke_result_t<F, const A&>>;
            if(ta.isNone()) return applicative<GTag>::pure(option<B>());
            return functor<GTag>::map(std::invoke(f, ta.value()), [](const B& b) {
                return option<B>(b);
            });
        }
    };

}
