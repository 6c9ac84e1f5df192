#pragma once

#include <type_traits>

namespace prelude {

    template<typename A> class option;
    template<typename A> class seq;
    template<typename L, typename R> class either;
    template<typename A> class task;
    template<typename A> class option_async;
    template<typename A> struct identity;

    // A tag stands in for a type constructor F, so that F itself can be
    // passed around and specialised on. Tag::apply<A> is F<A>.
    struct option_tag {
        template<typename A>
        using apply = option<A>;
    };

    struct seq_tag {
        template<typename A>
        using apply = seq<A>;
    };

    template<typename L>
    struct either_tag {
        template<typename A>
        using apply = either<L, A>;
    };

    struct task_tag {
        template<typename A>
        using apply = task<A>;
    };

    struct option_async_tag {
        template<typename A>
        using apply = option_async<A>;
    };

    struct identity_tag {
        template<typename A>
        using apply = identity<A>;
    };

    // Splits a concrete container FA into its tag and bound type
    template<typename FA>
    struct kind;

    template<typename A>
    struct kind<option<A>> {
        using tag = option_tag;
        using value_type = A;
    };

    template<typename A>
    struct kind<seq<A>> {
        using tag = seq_tag;
        using value_type = A;
    };

    template<typename L, typename R>
    struct kind<either<L, R>> {
        using tag = either_tag<L>;
        using value_type = R;
    };

    template<typename A>
    struct kind<task<A>> {
        using tag = task_tag;
        using value_type = A;
    };

    template<typename A>
    struct kind<option_async<A>> {
        using tag = option_async_tag;
        using value_type = A;
    };

    template<typename A>
    struct kind<identity<A>> {
        using tag = identity_tag;
        using value_type = A;
    };

    template<typename FA>
    concept higher_kinded = requires {
        typename kind<std::remove_cvref_t<FA>>::tag;
        typename kind<std::remove_cvref_t<FA>>::value_type;
    };

    template<higher_kinded FA>
    using tag_of_t = typename kind<std::remove_cvref_t<FA>>::tag;

    template<higher_kinded FA>
    using value_of_t = typename kind<std::remove_cvref_t<FA>>::value_type;

    template<typename Tag, typename A>
    using apply_t = typename Tag::template apply<A>;

}
