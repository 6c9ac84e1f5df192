#pragma once

#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

#include <cxxprelude/kind.hpp>
#include <cxxprelude/log.hpp>
#include <cxxprelude/option.hpp>
#include <cxxprelude/option_async.hpp>
#include <cxxprelude/seq.hpp>
#include <cxxprelude/task.hpp>
#include <cxxprelude/typeclass.hpp>

namespace prelude {

    template<>
    struct functor<seq_tag> {
        template<typename A, typename F>
        static auto map(const seq<A>& fa, F f) {
            return fa.map(std::move(f));
        }
    };

    // pure is a singleton, apply pairs every function with every value,
    // functions in the outer loop
    template<>
    struct applicative<seq_tag> {
        template<typename A>
        static seq<A> pure(A a) {
            return seq<A>({std::move(a)});
        }

        template<typename FF, typename A>
        static auto apply(const seq<FF>& ff, const seq<A>& fa)
            -> seq<std::invoke_result_t<const FF&, const A&>> {
            using B = std::invoke_result_t<const FF&, const A&>;
            std::vector<B> out;
            out.reserve(ff.size() * fa.size());
            for(const FF& f : ff) {
                for(const A& a : fa) {
                    out.push_back(std::invoke(f, a));
                }
            }
            return seq<B>(std::move(out));
        }
    };

    template<>
    struct monad<seq_tag> {
        template<typename A, typename F>
        static auto bind(const seq<A>& ma, F f) {
            return ma.flatMap(std::move(f));
        }
    };

    template<>
    struct foldable<seq_tag> {
        template<typename A, typename S, typename F>
        static S fold(const seq<A>& fa, S state, F folder) {
            return fa.fold(std::move(state), std::move(folder));
        }

        template<typename A, typename S, typename F>
        static S foldBack(const seq<A>& fa, S state, F folder) {
            return fa.foldBack(std::move(state), std::move(folder));
        }

        template<typename A>
        static int count(const seq<A>& fa) {
            return static_cast<int>(fa.size());
        }
    };

    // Runs f over the elements left to right, accumulating the results
    // inside G.
    //
    // option, task and option_async are collected in a single loop. For the
    // task-backed shapes that loop is one delayed task which runs each
    // element in turn, so the result never nests deeper than one level
    // however long the sequence is.
    template<>
    struct traversable<seq_tag> {
        template<typename GTag, typename A, typename F>
        static auto traverse(const seq<A>& ta, F f) {
            using B = value_of_t<std::invoke_result_t<F, const A&>>;
            if constexpr (std::is_same_v<GTag, option_tag>) {
                std::vector<B> out;
                out.reserve(ta.size());
                for(const A& a : ta) {
                    option<B> b = std::invoke(f, a);
                    if(b.isNone()) return option<seq<B>>();
                    out.push_back(b.value());
                }
                return option<seq<B>>(seq<B>(std::move(out)));
            } else if constexpr (std::is_same_v<GTag, task_tag>) {
                return task<seq<B>>::delay([ta, f]() {
                    log::trace("running {} tasks in sequence", ta.size());
                    std::vector<B> out;
                    out.reserve(ta.size());
                    for(const A& a : ta) {
                        out.push_back(std::invoke(f, a).unsafeRunSync());
                    }
                    return seq<B>(std::move(out));
                });
            } else if constexpr (std::is_same_v<GTag, option_async_tag>) {
                return option_async<seq<B>>(task<option<seq<B>>>::delay([ta, f]() {
                    log::trace("running {} optional tasks in sequence", ta.size());
                    std::vector<B> out;
                    out.reserve(ta.size());
                    for(const A& a : ta) {
                        option<B> b = std::invoke(f, a).toOption().unsafeRunSync();
                        if(b.isNone()) return option<seq<B>>();
                        out.push_back(b.value());
                    }
                    return option<seq<B>>(seq<B>(std::move(out)));
                }));
            } else {
                auto acc = applicative<GTag>::pure(seq<B>());
                for(const A& a : ta) {
                    acc = map2<GTag>(acc, std::invoke(f, a), [](const seq<B>& bs, const B& b) {
                        return bs.add(b);
                    });
                }
                return acc;
            }
        }
    };

}
