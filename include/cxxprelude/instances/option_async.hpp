#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include <cxxprelude/kind.hpp>
#include <cxxprelude/option.hpp>
#include <cxxprelude/optional_async.hpp>
#include <cxxprelude/prelude.hpp>
#include <cxxprelude/task.hpp>
#include <cxxprelude/typeclass.hpp>

namespace prelude {

    // option_async<A> is a task<option<A>>. match is the one primitive
    // every other instance below is built from.
    template<>
    struct optional_async<option_async_tag> {
        template<typename A>
        static option_async<A> fromTask(task<option<A>> pending) {
            return option_async<A>(std::move(pending));
        }

        template<typename A>
        static task<option<A>> toOption(const option_async<A>& ma) {
            return ma.toOption();
        }

        template<typename A>
        static option_async<A> some(A a) {
            return fromTask(task<option<A>>::pure(option<A>(std::move(a))));
        }

        template<typename A>
        static option_async<A> none() {
            return fromTask(task<option<A>>::pure(option<A>()));
        }

        template<typename A>
        static bool isLazy(const option_async<A>& ma) {
            return ma.toOption().isLazy();
        }

        template<typename A>
        static task<bool> isSome(const option_async<A>& ma) {
            return ma.toOption().map([](const option<A>& o) { return o.isSome(); });
        }

        template<typename A>
        static task<bool> isNone(const option_async<A>& ma) {
            return ma.toOption().map([](const option<A>& o) { return o.isNone(); });
        }

        // Both arms may return a value or a task. The result type comes
        // from the Some arm; the None arm's result is converted to it.
        template<typename A, typename FS, typename FN>
        static auto match(const option_async<A>& ma, FS onSome, FN onNone)
            -> task<task_value_t<detail::invoke_unit_t<const FS&, const A&>>> {
            using R = task_value_t<detail::invoke_unit_t<const FS&, const A&>>;
            return ma.toOption().flatMap([onSome, onNone](const option<A>& o) {
                if(o.isSome()) return to_task_as<R>(detail::invoke_unit(onSome, o.value()));
                return to_task_as<R>(detail::invoke_unit(onNone));
            });
        }
    };

    template<>
    struct functor<option_async_tag> {
        using instance = optional_async<option_async_tag>;

        // f : A -> B or A -> task<B>
        template<typename A, typename F>
        static auto map(const option_async<A>& fa, F f) {
            using B = task_value_t<std::invoke_result_t<const F&, const A&>>;
            return instance::fromTask(instance::match(fa,
                [f](const A& a) {
                    return to_task(std::invoke(f, a)).map([](B b) { return option<B>(std::move(b)); });
                },
                []() { return option<B>(); }));
        }

        // Unlike map, a None is turned into a Some by the None arm
        template<typename A, typename FS, typename FN>
        static auto biMap(const option_async<A>& fa, FS onSome, FN onNone) {
            using B = task_value_t<std::invoke_result_t<const FS&, const A&>>;
            auto none = detail::nullary(std::move(onNone));
            return instance::fromTask(instance::match(fa,
                [onSome](const A& a) {
                    return to_task_as<B>(std::invoke(onSome, a)).map([](B b) { return option<B>(std::move(b)); });
                },
                [none]() {
                    return to_task_as<B>(std::invoke(none)).map([](B b) { return option<B>(std::move(b)); });
                }));
        }
    };

    template<>
    struct monad<option_async_tag> {
        using instance = optional_async<option_async_tag>;

        // f : A -> option_async<B>
        template<typename A, typename F>
        static auto bind(const option_async<A>& ma, F f) -> std::invoke_result_t<const F&, const A&> {
            using B = value_of_t<std::invoke_result_t<const F&, const A&>>;
            return instance::fromTask(instance::match(ma,
                [f](const A& a) { return instance::toOption(std::invoke(f, a)); },
                []() { return option<B>(); }));
        }
    };

    template<>
    struct applicative<option_async_tag> {
        template<typename A>
        static option_async<A> pure(A a) {
            return optional_async<option_async_tag>::some(std::move(a));
        }

        template<typename FF, typename A>
        static auto apply(const option_async<FF>& ff, const option_async<A>& fa) {
            return monad<option_async_tag>::bind(ff, [fa](const FF& f) {
                return functor<option_async_tag>::map(fa, f);
            });
        }
    };

    template<>
    struct foldable<option_async_tag> {
        using instance = optional_async<option_async_tag>;

        // folder : (S, A) -> S or (S, A) -> task<S>
        template<typename A, typename S, typename F>
        static task<S> fold(const option_async<A>& fa, S state, F folder) {
            return instance::match(fa,
                [state, folder](const A& a) { return to_task_as<S>(std::invoke(folder, state, a)); },
                [state]() { return state; });
        }

        template<typename A, typename S, typename F>
        static task<S> foldBack(const option_async<A>& fa, S state, F folder) {
            return fold(fa, std::move(state), std::move(folder));
        }

        // The None arm takes (S, unit) or (S), and may also return a task
        template<typename A, typename S, typename FS, typename FN>
        static task<S> biFold(const option_async<A>& fa, S state, FS onSome, FN onNone) {
            auto none = detail::stateful<S>(std::move(onNone));
            return instance::match(fa,
                [state, onSome](const A& a) { return to_task_as<S>(std::invoke(onSome, state, a)); },
                [state, none]() { return to_task_as<S>(std::invoke(none, state)); });
        }

        template<typename A>
        static task<int> count(const option_async<A>& fa) {
            return instance::match(fa, [](const A&) { return 1; }, []() { return 0; });
        }
    };

}
