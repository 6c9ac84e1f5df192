#pragma once

#include <functional>
#include <type_traits>

#include <cxxprelude/either.hpp>
#include <cxxprelude/typeclass.hpp>

namespace prelude {

    template<typename L>
    struct functor<either_tag<L>> {
        template<typename A, typename F>
        static auto map(const either<L, A>& fa, F f) {
            return fa.map(std::move(f));
        }
    };

    // apply keeps the first Left it meets
    template<typename L>
    struct applicative<either_tag<L>> {
        template<typename A>
        static either<L, A> pure(A a) {
            return either<L, A>::Right(std::move(a));
        }

        template<typename FF, typename A>
        static auto apply(const either<L, FF>& ff, const either<L, A>& fa)
            -> either<L, std::invoke_result_t<const FF&, const A&>> {
            using B = std::invoke_result_t<const FF&, const A&>;
            if(ff.isLeft()) return either<L, B>::Left(ff.leftValue());
            if(fa.isLeft()) return either<L, B>::Left(fa.leftValue());
            return either<L, B>::Right(std::invoke(ff.rightValue(), fa.rightValue()));
        }
    };

    template<typename L>
    struct monad<either_tag<L>> {
        template<typename A, typename F>
        static auto bind(const either<L, A>& ma, F f) {
            return ma.flatMap(std::move(f));
        }
    };

    template<typename L>
    struct foldable<either_tag<L>> {
        template<typename A, typename S, typename F>
        static S fold(const either<L, A>& fa, S state, F folder) {
            return fa.fold(std::move(state), std::move(folder));
        }

        template<typename A, typename S, typename F>
        static S foldBack(const either<L, A>& fa, S state, F folder) {
            return fa.fold(std::move(state), std::move(folder));
        }

        template<typename A>
        static int count(const either<L, A>& fa) {
            return fa.isRight() ? 1 : 0;
        }
    };

    template<typename L>
    struct traversable<either_tag<L>> {
        template<typename GTag, typename A, typename F>
        static auto traverse(const either<L, A>& ta, F f) {
            using B = value_of_t<std::invoke_result_t<F, const A&>>;
            if(ta.isLeft()) return applicative<GTag>::pure(either<L, B>::Left(ta.leftValue()));
            return functor<GTag>::map(std::invoke(f, ta.rightValue()), [](const B& b) {
                return either<L, B>::Right(b);
            });
        }
    };

}
