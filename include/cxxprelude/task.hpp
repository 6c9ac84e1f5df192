#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include <cxxprelude/config.hpp>
#include <cxxprelude/either.hpp>
#include <cxxprelude/kind.hpp>
#include <cxxprelude/log.hpp>
#include <cxxprelude/prelude.hpp>

namespace prelude {

    template<typename A>
    class task;

    template<typename T>
    struct is_task : std::false_type {};
    template<typename A>
    struct is_task<task<A>> : std::true_type {};

    template<typename T>
    constexpr bool is_task_v = is_task<std::remove_cvref_t<T>>::value;

    // Matches task<A> forall A
    template<typename T>
    concept task_type = is_task_v<T>;

    // The value a callback result stands for: A for task<A>, T otherwise
    template<typename T>
    struct task_value {
        using type = T;
    };
    template<typename A>
    struct task_value<task<A>> {
        using type = A;
    };

    template<typename T>
    using task_value_t = typename task_value<std::remove_cvref_t<T>>::type;

    template<typename A>
    class raw_task {
        public:
        virtual ~raw_task() = default;
        virtual A unsafeRunSync() const = 0;
        virtual std::future<A> unsafeRunAsync() const = 0;
        // False when the value is already known or already being computed
        virtual bool lazy() const = 0;
    };

    template<typename A>
    class raw_task_pure final : public raw_task<A> {
        A value;
        public:
        raw_task_pure(A a) : value(std::move(a)) {}

        A unsafeRunSync() const {
            return value;
        }

        std::future<A> unsafeRunAsync() const {
            std::promise<A> ready;
            ready.set_value(value);
            return ready.get_future();
        }

        bool lazy() const {
            return false;
        }
    };

    template<typename A>
    class raw_task_raise final : public raw_task<A> {
        std::exception_ptr failure;
        public:
        raw_task_raise(std::exception_ptr a) : failure(std::move(a)) {}

        A unsafeRunSync() const {
            std::rethrow_exception(failure);
        }

        std::future<A> unsafeRunAsync() const {
            std::promise<A> failed;
            failed.set_exception(failure);
            return failed.get_future();
        }

        bool lazy() const {
            return false;
        }
    };

    template<typename A>
    class raw_task_delay final : public raw_task<A> {
        std::function<A ()> thunk;
        public:
        raw_task_delay(std::function<A ()> a) : thunk(std::move(a)) {}

        A unsafeRunSync() const {
            return thunk();
        }

        std::future<A> unsafeRunAsync() const {
            log::trace("launching delayed task");
            return std::async(config().launch_policy, thunk);
        }

        bool lazy() const {
            return true;
        }
    };

    // Wraps a value that something else is already computing
    template<typename A>
    class raw_task_future final : public raw_task<A> {
        std::shared_future<A> pending;
        public:
        raw_task_future(std::shared_future<A> a) : pending(std::move(a)) {}

        A unsafeRunSync() const {
            return pending.get();
        }

        std::future<A> unsafeRunAsync() const {
            return std::async(config().launch_policy, [pending = pending]() {
                return pending.get();
            });
        }

        bool lazy() const {
            return false;
        }
    };

    template<typename A, typename B>
    class raw_task_map final : public raw_task<B> {
        task<A> ta;
        std::function<B (A)> f;
        public:
        raw_task_map(task<A> a, std::function<B (A)> b) : ta(std::move(a)), f(std::move(b)) {}

        B unsafeRunSync() const {
            A va = ta.unsafeRunSync();
            return f(std::move(va));
        }

        std::future<B> unsafeRunAsync() const {
            std::future<A> fa = ta.unsafeRunAsync();
            log::trace("launching mapped task");
            return std::async(config().launch_policy, [f = f](std::future<A>&& fa) {
                return f(fa.get());
            }, std::move(fa));
        }

        bool lazy() const {
            return true;
        }
    };

    template<typename A, typename B>
    class raw_task_flatmap final : public raw_task<B> {
        task<A> ta;
        std::function<task<B> (A)> f;
        public:
        raw_task_flatmap(task<A> a, std::function<task<B> (A)> b) : ta(std::move(a)), f(std::move(b)) {}

        B unsafeRunSync() const {
            A va = ta.unsafeRunSync();
            task<B> tb = f(std::move(va));
            return tb.unsafeRunSync();
        }

        std::future<B> unsafeRunAsync() const {
            std::future<A> fa = ta.unsafeRunAsync();
            log::trace("launching bound task");
            return std::async(config().launch_policy, [f = f](std::future<A>&& fa) {
                task<B> tb = f(fa.get());
                std::future<B> fb = tb.unsafeRunAsync();
                return fb.get();
            }, std::move(fa));
        }

        bool lazy() const {
            return true;
        }
    };

    template<typename A>
    class raw_task_recover final : public raw_task<A> {
        task<A> ta;
        std::function<task<A> (std::exception_ptr)> handler;
        public:
        raw_task_recover(task<A> a, std::function<task<A> (std::exception_ptr)> b)
            : ta(std::move(a)), handler(std::move(b)) {}

        A unsafeRunSync() const {
            std::exception_ptr failure;
            try {
                return ta.unsafeRunSync();
            } catch(...) {
                failure = std::current_exception();
            }
            log::debug("task failed, running its error handler");
            return handler(failure).unsafeRunSync();
        }

        std::future<A> unsafeRunAsync() const {
            std::future<A> fa = ta.unsafeRunAsync();
            return std::async(config().launch_policy, [handler = handler](std::future<A>&& fa) {
                std::exception_ptr failure;
                try {
                    return fa.get();
                } catch(...) {
                    failure = std::current_exception();
                }
                log::debug("asynchronous task failed, running its error handler");
                return handler(failure).unsafeRunAsync().get();
            }, std::move(fa));
        }

        bool lazy() const {
            return true;
        }
    };

    // An immutable description of a computation that produces an A, either
    // on the calling thread (unsafeRunSync) or through std::async
    // (unsafeRunAsync). Failures travel as exceptions and are rethrown when
    // the value is demanded.
    template<typename A>
    class task final {
        std::shared_ptr<raw_task<A>> internal;

        public:
        using type = A;

        task(std::shared_ptr<raw_task<A>> a) : internal(std::move(a)) {}

        static task<A> pure(A a) {
            return task<A>(std::make_shared<raw_task_pure<A>>(std::move(a)));
        }

        static task<A> delay(std::function<A ()> thunk) {
            return task<A>(std::make_shared<raw_task_delay<A>>(std::move(thunk)));
        }

        static task<A> raise(std::exception_ptr failure) {
            return task<A>(std::make_shared<raw_task_raise<A>>(std::move(failure)));
        }

        template<typename E>
        static task<A> raise_error(E e) {
            return raise(std::make_exception_ptr(std::move(e)));
        }

        static task<A> from_future(std::shared_future<A> pending) {
            return task<A>(std::make_shared<raw_task_future<A>>(std::move(pending)));
        }

        template<typename F>
            requires std::regular_invocable<F, A>
        auto map(F f) const -> task<std::invoke_result_t<F, A>> {
            using B = std::invoke_result_t<F, A>;
            return task<B>(std::make_shared<raw_task_map<A, B>>(*this, std::function<B (A)>(std::move(f))));
        }

        template<typename B>
        task<B> as(B b) const {
            return map([b](const A&) { return b; });
        }

        // Takes a function which takes an input of type A, and produces a
        // task of type B. This is task A -> (A -> task B) -> task B
        template<typename F>
            requires std::regular_invocable<F, A> && task_type<std::invoke_result_t<F, A>>
        auto flatMap(F f) const -> std::invoke_result_t<F, A> {
            using B = typename std::invoke_result_t<F, A>::type;
            return task<B>(std::make_shared<raw_task_flatmap<A, B>>(*this, std::function<task<B> (A)>(std::move(f))));
        }

        // Like flatMap, but f may return either B or task<B>
        template<typename F>
            requires std::regular_invocable<F, A>
        auto then(F f) const -> task<task_value_t<std::invoke_result_t<F, A>>> {
            using R = std::invoke_result_t<F, A>;
            if constexpr (is_task_v<R>) {
                return flatMap(std::move(f));
            } else {
                return map(std::move(f));
            }
        }

        template<typename F>
            requires std::regular_invocable<F, std::exception_ptr>
        task<A> handleErrorWith(F handler) const {
            return task<A>(std::make_shared<raw_task_recover<A>>(
                *this, std::function<task<A> (std::exception_ptr)>(std::move(handler))));
        }

        // Moves a failure into a Left so it can be inspected as a value
        task<either<std::exception_ptr, A>> attempt() const {
            using result_t = either<std::exception_ptr, A>;
            return map([](A a) { return result_t::Right(std::move(a)); })
                .handleErrorWith([](std::exception_ptr failure) {
                    return task<result_t>::pure(result_t::Left(std::move(failure)));
                });
        }

        bool isLazy() const {
            return internal->lazy();
        }

        A unsafeRunSync() const {
            return internal->unsafeRunSync();
        }

        std::future<A> unsafeRunAsync() const {
            return internal->unsafeRunAsync();
        }
    };

    // Lifts a callback result into a task: tasks pass through, plain values
    // become completed tasks
    template<typename T>
    task<task_value_t<T>> to_task(T value) {
        if constexpr (is_task_v<T>) {
            return value;
        } else {
            return task<T>::pure(std::move(value));
        }
    }

    // As to_task, converting the value to R on the way
    template<typename R, typename T>
    task<R> to_task_as(T value) {
        if constexpr (std::is_same_v<std::remove_cvref_t<T>, task<R>>) {
            return value;
        } else if constexpr (is_task_v<T>) {
            return value.map([](task_value_t<T> v) { return R(std::move(v)); });
        } else {
            return task<R>::pure(R(std::move(value)));
        }
    }

    // Discards whatever a callback produced, waiting for it first if it's
    // a task
    template<typename T>
    task<unit> to_unit_task(T value) {
        if constexpr (is_task_v<T>) {
            return value.as(unit{});
        } else {
            return task<unit>::pure(unit{});
        }
    }

}
