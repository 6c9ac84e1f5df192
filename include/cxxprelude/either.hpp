#pragma once

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include <cxxprelude/errors.hpp>
#include <cxxprelude/kind.hpp>
#include <cxxprelude/prelude.hpp>

namespace prelude {

    // Constructors that don't yet know the other side's type.
    // left(e) converts to any either<E, R>, right(a) to any either<L, A>.
    template<typename L>
    struct left_t {
        L value;
    };

    template<typename R>
    struct right_t {
        R value;
    };

    template<typename L>
    left_t<std::decay_t<L>> left(L&& value) {
        return {std::forward<L>(value)};
    }

    template<typename R>
    right_t<std::decay_t<R>> right(R&& value) {
        return {std::forward<R>(value)};
    }

    // Disjoint union, biased towards Right
    template<typename L, typename R>
    class either final {
        // Indexed rather than typed so either<T, T> works
        std::variant<L, R> internal;

        public:
        using left_type = L;
        using right_type = R;

        template<typename L2>
            requires std::constructible_from<L, L2>
        either(left_t<L2> l) : internal(std::in_place_index<0>, std::move(l.value)) {}

        template<typename R2>
            requires std::constructible_from<R, R2>
        either(right_t<R2> r) : internal(std::in_place_index<1>, std::move(r.value)) {}

        static either Left(L l) {
            return either(left_t<L>{std::move(l)});
        }

        static either Right(R r) {
            return either(right_t<R>{std::move(r)});
        }

        bool isLeft() const {
            return internal.index() == 0;
        }

        bool isRight() const {
            return internal.index() == 1;
        }

        const L& leftValue() const {
            if(!isLeft()) throw value_is_right();
            return std::get<0>(internal);
        }

        const R& rightValue() const {
            if(!isRight()) throw value_is_left();
            return std::get<1>(internal);
        }

        template<typename F>
            requires std::invocable<F, const R&>
        auto map(F f) const -> either<L, std::invoke_result_t<F, const R&>> {
            using B = std::invoke_result_t<F, const R&>;
            if(isLeft()) return either<L, B>::Left(leftValue());
            return either<L, B>::Right(std::invoke(f, rightValue()));
        }

        template<typename F>
            requires std::invocable<F, const L&>
        auto mapLeft(F f) const -> either<std::invoke_result_t<F, const L&>, R> {
            using M = std::invoke_result_t<F, const L&>;
            if(isLeft()) return either<M, R>::Left(std::invoke(f, leftValue()));
            return either<M, R>::Right(rightValue());
        }

        template<typename FL, typename FR>
        auto bimap(FL fl, FR fr) const
            -> either<std::invoke_result_t<FL, const L&>, std::invoke_result_t<FR, const R&>> {
            using M = std::invoke_result_t<FL, const L&>;
            using B = std::invoke_result_t<FR, const R&>;
            if(isLeft()) return either<M, B>::Left(std::invoke(fl, leftValue()));
            return either<M, B>::Right(std::invoke(fr, rightValue()));
        }

        // f must return an either with the same Left type
        template<typename F>
            requires std::invocable<F, const R&>
        auto flatMap(F f) const -> std::invoke_result_t<F, const R&> {
            using EB = std::invoke_result_t<F, const R&>;
            static_assert(std::is_same_v<typename EB::left_type, L>,
                          "flatMap must keep the Left type");
            if(isLeft()) return EB::Left(leftValue());
            return std::invoke(f, rightValue());
        }

        template<typename FR, typename FL>
        auto match(FR onRight, FL onLeft) const {
            if(isRight()) return std::invoke(onRight, rightValue());
            return std::invoke(onLeft, leftValue());
        }

        // The Right value, or the result of f applied to the Left one
        template<typename F>
            requires std::invocable<F, const L&>
        R ifLeft(F f) const {
            if(isRight()) return rightValue();
            return std::invoke(f, leftValue());
        }

        R ifLeft(R fallback) const {
            if(isRight()) return rightValue();
            return fallback;
        }

        template<typename S, typename F>
        S fold(S state, F folder) const {
            if(isLeft()) return state;
            return std::invoke(folder, std::move(state), rightValue());
        }

        option<R> toOption() const;

        friend bool operator==(const either& a, const either& b) {
            return a.internal == b.internal;
        }
    };

}
