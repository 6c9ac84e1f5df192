#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <cxxprelude/either.hpp>
#include <cxxprelude/format.hpp>
#include <cxxprelude/instances/option_async.hpp>
#include <cxxprelude/kind.hpp>
#include <cxxprelude/option.hpp>
#include <cxxprelude/optional_async.hpp>
#include <cxxprelude/seq.hpp>
#include <cxxprelude/task.hpp>
#include <cxxprelude/typeclass.hpp>

namespace prelude {

    namespace detail {
        struct deduced_left {};
    }

    // An optional value whose state (Some or None) is only known once a
    // task completes. Nothing runs until one of the returned tasks is run.
    //
    // Every operation forwards to the option_async_tag typeclass instances,
    // or to the optional_async algorithms built on them. Callbacks may
    // return plain values or tasks.
    template<typename A>
    class option_async final {
        task<option<A>> internal;

        using optional = optional_async<option_async_tag>;

        public:
        using value_type = A;

        static const option_async None;

        option_async() : internal(task<option<A>>::pure(option<A>())) {}
        option_async(none_t) : option_async() {}
        option_async(A a) : internal(task<option<A>>::pure(option<A>(std::move(a)))) {}
        option_async(option<A> o) : internal(task<option<A>>::pure(std::move(o))) {}
        option_async(task<option<A>> pending) : internal(std::move(pending)) {}

        // Some of whatever the task produces
        explicit option_async(const task<A>& value)
            : internal(value.map([](A a) { return option<A>(std::move(a)); })) {}

        // Some of the first element of the range, or None if it's empty
        template<std::ranges::input_range R>
        static option_async from(R&& range) {
            return option_async(option<A>::from(std::forward<R>(range)));
        }

        // True when the state is not known until work is done
        bool isLazy() const {
            return optional::isLazy(*this);
        }

        task<bool> isSome() const {
            return optional::isSome(*this);
        }

        task<bool> isNone() const {
            return optional::isNone(*this);
        }

        // Fails with value_is_none when run on a None
        task<A> value() const {
            return internal.map([](const option<A>& o) { return o.value(); });
        }

        template<typename F>
        auto map(F f) const {
            return functor<option_async_tag>::map(*this, std::move(f));
        }

        template<typename F>
        auto select(F f) const {
            return map(std::move(f));
        }

        template<typename F>
        auto bind(F f) const {
            return monad<option_async_tag>::bind(*this, std::move(f));
        }

        template<typename F, typename P>
        auto selectMany(F bindf, P project) const {
            return bind([bindf, project](const A& a) {
                return std::invoke(bindf, a).map([a, project](const auto& b) {
                    return std::invoke(project, a, b);
                });
            });
        }

        template<typename FS, typename FN>
        auto match(FS onSome, FN onNone) const {
            return optional::match(*this, std::move(onSome), std::move(onNone));
        }

        template<typename F>
        task<unit> ifSome(F f) const {
            return ifSomeAsync(*this, std::move(f));
        }

        template<typename F>
        task<A> ifNone(F fallback) const {
            return ifNoneAsync(*this, std::move(fallback));
        }

        template<typename S, typename F>
        task<S> fold(S state, F folder) const {
            return foldable<option_async_tag>::fold(*this, std::move(state), std::move(folder));
        }

        template<typename S, typename F>
        task<S> foldBack(S state, F folder) const {
            return foldable<option_async_tag>::foldBack(*this, std::move(state), std::move(folder));
        }

        template<typename S, typename FS, typename FN>
        task<S> biFold(S state, FS onSome, FN onNone) const {
            return foldable<option_async_tag>::biFold(*this, std::move(state), std::move(onSome), std::move(onNone));
        }

        template<typename FS, typename FN>
        auto biMap(FS onSome, FN onNone) const {
            return functor<option_async_tag>::biMap(*this, std::move(onSome), std::move(onNone));
        }

        task<int> count() const {
            return foldable<option_async_tag>::count(*this);
        }

        template<typename P>
        task<bool> forAll(P pred) const {
            return forAllAsync(*this, std::move(pred));
        }

        template<typename PS, typename PN>
        task<bool> biForAll(PS onSome, PN onNone) const {
            return biForAllAsync(*this, std::move(onSome), std::move(onNone));
        }

        template<typename P>
        task<bool> exists(P pred) const {
            return existsAsync(*this, std::move(pred));
        }

        template<typename PS, typename PN>
        task<bool> biExists(PS onSome, PN onNone) const {
            return biExistsAsync(*this, std::move(onSome), std::move(onNone));
        }

        template<typename F>
        task<unit> iter(F f) const {
            return ifSomeAsync(*this, std::move(f));
        }

        template<typename FS, typename FN>
        task<unit> biIter(FS onSome, FN onNone) const {
            return biIterAsync(*this, std::move(onSome), std::move(onNone));
        }

        template<typename P>
        option_async filter(P pred) const {
            return filterAsync(*this, std::move(pred));
        }

        template<typename P>
        option_async where(P pred) const {
            return filterAsync(*this, std::move(pred));
        }

        template<typename B, typename KA, typename KB, typename P>
        auto join(const option_async<B>& inner, KA outerKey, KB innerKey, P project) const {
            return joinAsync(*this, inner, std::move(outerKey), std::move(innerKey), std::move(project));
        }

        // Partial application: maps f(a, _) into a function of the second
        // argument
        template<typename B, typename F>
            requires std::invocable<const F&, const A&, const B&>
        auto parMap(F f) const {
            using C = std::invoke_result_t<const F&, const A&, const B&>;
            return map([f](const A& a) {
                return std::function<C (const B&)>(curry2(f)(a));
            });
        }

        template<typename B, typename C, typename F>
            requires std::invocable<const F&, const A&, const B&, const C&>
        auto parMap(F f) const {
            using D = std::invoke_result_t<const F&, const A&, const B&, const C&>;
            using inner_t = std::function<D (const C&)>;
            return map([f](const A& a) {
                return std::function<inner_t (const B&)>(curry3(f)(a));
            });
        }

        task<option<A>> toOption() const {
            return internal;
        }

        task<seq<A>> toSeq() const {
            return internal.map([](const option<A>& o) { return o.toSeq(); });
        }

        task<std::vector<A>> toVector() const {
            return internal.map([](const option<A>& o) { return o.toSeq().toVector(); });
        }

        // left is the Left value or a thunk producing it. Without an explicit
        // L a callable is always a thunk; name L to keep a callable as the
        // value, as in toEither<std::function<int ()>>(f).
        template<typename L = detail::deduced_left, typename F>
        auto toEither(F left) const {
            if constexpr (std::is_same_v<L, detail::deduced_left>) {
                if constexpr (std::invocable<const F&>) {
                    return toEitherFrom<std::invoke_result_t<const F&>>(std::move(left));
                } else {
                    return toEitherFrom<F>(std::move(left));
                }
            } else {
                return toEitherFrom<L>(std::move(left));
            }
        }

        private:
        template<typename L, typename F>
        task<either<L, A>> toEitherFrom(F left) const {
            using result_t = either<L, A>;
            return match([](const A& a) { return result_t::Right(a); },
                         [left]() {
                             if constexpr (std::is_convertible_v<const F&, L>) {
                                 return result_t::Left(L(left));
                             } else {
                                 return result_t::Left(std::invoke(left));
                             }
                         });
        }

        public:

        // Runs the task on the calling thread
        std::string toString() const {
            return fmt::format("{}", internal.unsafeRunSync());
        }

        // Runs the task on the calling thread
        std::size_t hash() const {
            return std::hash<option<A>>()(internal.unsafeRunSync());
        }

        // lhs if it turns out to be Some, otherwise rhs
        friend option_async operator|(const option_async& lhs, const option_async& rhs) {
            return plusAsync(lhs, rhs);
        }
    };

    template<typename A>
    const option_async<A> option_async<A>::None = option_async<A>();

    template<typename A>
    option_async<std::decay_t<A>> some_async(A&& value) {
        return option_async<std::decay_t<A>>(std::forward<A>(value));
    }

}
