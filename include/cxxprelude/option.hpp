#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>

#include <cxxprelude/either.hpp>
#include <cxxprelude/errors.hpp>
#include <cxxprelude/kind.hpp>
#include <cxxprelude/prelude.hpp>
#include <cxxprelude/seq.hpp>

namespace prelude {

    // Converts to an option<A> in the None state, for any A
    struct none_t {
        constexpr bool operator==(const none_t&) const = default;
    };

    inline constexpr none_t none{};

    // An optional value: Some(a) or None
    template<typename A>
    class option final {
        std::optional<A> internal;

        public:
        using value_type = A;

        static const option None;

        option() = default;
        option(none_t) {}
        option(A a) : internal(std::move(a)) {}

        // Some of the first element of the range, or None if it's empty
        template<std::ranges::input_range R>
        static option from(R&& range) {
            auto first = std::ranges::begin(range);
            if(first == std::ranges::end(range)) return option();
            return option(*first);
        }

        bool isSome() const {
            return internal.has_value();
        }

        bool isNone() const {
            return !internal.has_value();
        }

        explicit operator bool() const {
            return isSome();
        }

        const A& value() const {
            if(!internal) throw value_is_none();
            return *internal;
        }

        template<typename F>
            requires std::invocable<F, const A&>
        auto map(F f) const -> option<std::invoke_result_t<F, const A&>> {
            using B = std::invoke_result_t<F, const A&>;
            if(isNone()) return option<B>();
            return option<B>(std::invoke(f, *internal));
        }

        template<typename F>
            requires std::invocable<F, const A&>
        auto flatMap(F f) const -> std::invoke_result_t<F, const A&> {
            using OB = std::invoke_result_t<F, const A&>;
            if(isNone()) return OB();
            return std::invoke(f, *internal);
        }

        template<typename F>
        auto bind(F f) const {
            return flatMap(std::move(f));
        }

        // The None arm takes either unit or nothing
        template<typename FS, typename FN>
        auto biMap(FS onSome, FN onNone) const -> option<std::invoke_result_t<FS, const A&>> {
            using B = std::invoke_result_t<FS, const A&>;
            if(isSome()) return option<B>(std::invoke(onSome, *internal));
            if constexpr (std::invocable<FN, unit>) {
                return option<B>(std::invoke(onNone, unit{}));
            } else {
                return option<B>(std::invoke(onNone));
            }
        }

        template<typename P>
        option filter(P pred) const {
            if(isSome() && std::invoke(pred, *internal)) return *this;
            return option();
        }

        template<typename FS, typename FN>
        auto match(FS onSome, FN onNone) const -> std::invoke_result_t<FS, const A&> {
            if(isSome()) return std::invoke(onSome, *internal);
            return std::invoke(onNone);
        }

        // The bound value, or the fallback (a value or a thunk producing one).
        // A fallback that converts to A is a value even when it is callable.
        template<typename F>
        A ifNone(F fallback) const {
            if(isSome()) return *internal;
            if constexpr (std::is_convertible_v<F, A>) {
                return A(std::move(fallback));
            } else {
                return std::invoke(fallback);
            }
        }

        template<typename F>
        unit ifSome(F f) const {
            if(isSome()) detail::invoke_unit(f, *internal);
            return unit{};
        }

        template<typename S, typename F>
        S fold(S state, F folder) const {
            if(isNone()) return state;
            return std::invoke(folder, std::move(state), *internal);
        }

        // An option holds at most one value, so folding from the back is
        // the same as folding from the front
        template<typename S, typename F>
        S foldBack(S state, F folder) const {
            return fold(std::move(state), std::move(folder));
        }

        template<typename S, typename FS, typename FN>
        S biFold(S state, FS onSome, FN onNone) const {
            if(isSome()) return std::invoke(onSome, std::move(state), *internal);
            if constexpr (std::invocable<FN, S, unit>) {
                return std::invoke(onNone, std::move(state), unit{});
            } else {
                return std::invoke(onNone, std::move(state));
            }
        }

        int count() const {
            return isSome() ? 1 : 0;
        }

        // True for None: the predicate holds for every bound value
        template<typename P>
        bool forAll(P pred) const {
            return isNone() || std::invoke(pred, *internal);
        }

        template<typename P>
        bool exists(P pred) const {
            return isSome() && std::invoke(pred, *internal);
        }

        template<typename PS, typename PN>
        bool biForAll(PS onSome, PN onNone) const {
            if(isSome()) return std::invoke(onSome, *internal);
            if constexpr (std::invocable<PN, unit>) {
                return std::invoke(onNone, unit{});
            } else {
                return std::invoke(onNone);
            }
        }

        template<typename PS, typename PN>
        bool biExists(PS onSome, PN onNone) const {
            return biForAll(std::move(onSome), std::move(onNone));
        }

        template<typename F>
        unit iter(F f) const {
            return ifSome(std::move(f));
        }

        template<typename FS, typename FN>
        unit biIter(FS onSome, FN onNone) const {
            if(isSome()) {
                detail::invoke_unit(onSome, *internal);
            } else if constexpr (std::invocable<FN, unit>) {
                detail::invoke_unit(onNone, unit{});
            } else {
                detail::invoke_unit(onNone);
            }
            return unit{};
        }

        seq<A> toSeq() const {
            if(isNone()) return seq<A>();
            return seq<A>({*internal});
        }

        template<typename L>
        either<L, A> toEither(L leftValue) const {
            if(isSome()) return either<L, A>::Right(*internal);
            return either<L, A>::Left(std::move(leftValue));
        }

        // Partial application: Some(f(a)) as a function of the remaining argument
        template<typename B, typename F>
        auto parMap(F f) const -> option<std::function<std::invoke_result_t<F, const A&, const B&> (const B&)>> {
            using C = std::invoke_result_t<F, const A&, const B&>;
            return map([f](const A& a) {
                return std::function<C (const B&)>(curry2(f)(a));
            });
        }

        // Coalescing: lhs if it's Some, otherwise rhs
        friend option operator|(const option& lhs, const option& rhs) {
            return lhs.isSome() ? lhs : rhs;
        }

        friend bool operator==(const option& a, const option& b) {
            return a.internal == b.internal;
        }

        // None sorts before any Some
        friend bool operator<(const option& a, const option& b) {
            return a.internal < b.internal;
        }
    };

    template<typename A>
    const option<A> option<A>::None = option<A>();

    template<typename A>
    option<std::decay_t<A>> some(A&& value) {
        return option<std::decay_t<A>>(std::forward<A>(value));
    }

    template<typename L, typename R>
    option<R> either<L, R>::toOption() const {
        if(isRight()) return option<R>(rightValue());
        return option<R>();
    }

}

namespace std {
    template<typename A>
    struct hash<prelude::option<A>> {
        std::size_t operator()(const prelude::option<A>& o) const {
            return o.isSome() ? std::hash<A>()(o.value()) : 0;
        }
    };
}
