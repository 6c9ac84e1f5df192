#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

#include <cxxprelude/kind.hpp>

namespace prelude {

    // Typeclasses are specialised per tag. A specialisation provides:
    //
    //   functor<T>      map(fa, f)
    //   applicative<T>  pure(a), apply(ff, fa)
    //   monad<T>        bind(ma, f)
    //   foldable<T>     fold(fa, s, f), foldBack(fa, s, f), count(fa)
    //   traversable<T>  traverse<G>(ta, f) for any applicative G
    //   optional_async<T>  match(ma, some, none) and friends for optional
    //                      values whose state is only known asynchronously
    //
    // Each operation is then written once here, against the tag of its
    // argument, and works for every container with an instance.
    template<typename Tag> struct functor;
    template<typename Tag> struct applicative;
    template<typename Tag> struct monad;
    template<typename Tag> struct foldable;
    template<typename Tag> struct traversable;
    template<typename Tag> struct optional_async;

    namespace detail {
        struct identity_fn {
            template<typename A>
            A operator()(const A& a) const {
                return a;
            }
        };

        template<typename Tag>
        struct pure_fn {
            template<typename A>
            auto operator()(const A& a) const {
                return applicative<Tag>::pure(a);
            }
        };
    }

    template<typename FA>
    concept functor_of = higher_kinded<FA> && requires(const FA& fa) {
        functor<tag_of_t<FA>>::map(fa, detail::identity_fn{});
    };

    template<typename Tag>
    concept applicative_tag = requires(const apply_t<Tag, int>& fa) {
        { applicative<Tag>::pure(0) } -> std::same_as<apply_t<Tag, int>>;
        functor<Tag>::map(fa, detail::identity_fn{});
    };

    template<typename MA>
    concept monad_of = functor_of<MA> && requires(const MA& ma) {
        monad<tag_of_t<MA>>::bind(ma, detail::pure_fn<tag_of_t<MA>>{});
    };

    template<typename TA>
    concept traversable_of = higher_kinded<TA> && requires {
        sizeof(traversable<tag_of_t<TA>>);
    };

    template<functor_of FA, typename F>
    auto fmap(const FA& fa, F f) {
        return functor<tag_of_t<FA>>::map(fa, std::move(f));
    }

    template<typename Tag, typename A>
    auto pure(A a) {
        return applicative<Tag>::pure(std::move(a));
    }

    // Applies the function(s) inside ff to the value(s) inside fa
    template<higher_kinded FF, higher_kinded FA>
        requires std::same_as<tag_of_t<FF>, tag_of_t<FA>>
    auto apply(const FF& ff, const FA& fa) {
        return applicative<tag_of_t<FA>>::apply(ff, fa);
    }

    // Lifts a binary function into the applicative Tag
    template<typename Tag, typename FA, typename FB, typename F>
    auto map2(const FA& fa, const FB& fb, F f) {
        using A = value_of_t<FA>;
        using B = value_of_t<FB>;
        using C = std::invoke_result_t<F, const A&, const B&>;
        auto curried = functor<Tag>::map(fa, [f](const A& a) {
            return std::function<C (const B&)>([f, a](const B& b) {
                return std::invoke(f, a, b);
            });
        });
        return applicative<Tag>::apply(curried, fb);
    }

    template<higher_kinded MA, typename F>
    auto bind(const MA& ma, F f) {
        return monad<tag_of_t<MA>>::bind(ma, std::move(f));
    }

    template<higher_kinded FA, typename S, typename F>
    auto fold(const FA& fa, S state, F folder) {
        return foldable<tag_of_t<FA>>::fold(fa, std::move(state), std::move(folder));
    }

    template<higher_kinded FA, typename S, typename F>
    auto foldBack(const FA& fa, S state, F folder) {
        return foldable<tag_of_t<FA>>::foldBack(fa, std::move(state), std::move(folder));
    }

    template<higher_kinded FA>
    auto count(const FA& fa) {
        return foldable<tag_of_t<FA>>::count(fa);
    }

    // Maps each element of ta to an action in G and collects the results:
    // T<A> -> (A -> G<B>) -> G<T<B>>
    template<applicative_tag GTag, traversable_of TA, typename F>
    auto traverse(const TA& ta, F f) {
        return traversable<tag_of_t<TA>>::template traverse<GTag>(ta, std::move(f));
    }

    // As above, with G taken from the type f returns
    template<traversable_of TA, typename F>
        requires higher_kinded<std::invoke_result_t<F, const value_of_t<TA>&>>
    auto traverse(const TA& ta, F f) {
        using GTag = tag_of_t<std::invoke_result_t<F, const value_of_t<TA>&>>;
        static_assert(applicative_tag<GTag>, "traverse needs f to return an applicative");
        return traversable<tag_of_t<TA>>::template traverse<GTag>(ta, std::move(f));
    }

    // Turns T<G<A>> inside out into G<T<A>>
    template<traversable_of TGA>
        requires higher_kinded<value_of_t<TGA>>
    auto sequence(const TGA& tga) {
        using GTag = tag_of_t<value_of_t<TGA>>;
        static_assert(applicative_tag<GTag>, "sequence needs the inner container to be applicative");
        return traversable<tag_of_t<TGA>>::template traverse<GTag>(tga, detail::identity_fn{});
    }

}
