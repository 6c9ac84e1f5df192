#pragma once

#include <ostream>

#include <fmt/core.h>
#include <fmt/format.h>

#include <cxxprelude/either.hpp>
#include <cxxprelude/option.hpp>
#include <cxxprelude/prelude.hpp>
#include <cxxprelude/seq.hpp>

// fmt support: Some(x) / None, Left(l) / Right(r), [a, b, c] and ()

namespace fmt {

    template<>
    struct formatter<prelude::unit> {
        constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
            return ctx.begin();
        }

        template<typename FormatContext>
        auto format(const prelude::unit&, FormatContext& ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "()");
        }
    };

    template<typename A>
        requires fmt::is_formattable<A>::value
    struct formatter<prelude::option<A>> {
        constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
            return ctx.begin();
        }

        template<typename FormatContext>
        auto format(const prelude::option<A>& o, FormatContext& ctx) const -> decltype(ctx.out()) {
            if(o.isNone()) return fmt::format_to(ctx.out(), "None");
            return fmt::format_to(ctx.out(), "Some({})", o.value());
        }
    };

    template<typename L, typename R>
        requires fmt::is_formattable<L>::value && fmt::is_formattable<R>::value
    struct formatter<prelude::either<L, R>> {
        constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
            return ctx.begin();
        }

        template<typename FormatContext>
        auto format(const prelude::either<L, R>& e, FormatContext& ctx) const -> decltype(ctx.out()) {
            if(e.isLeft()) return fmt::format_to(ctx.out(), "Left({})", e.leftValue());
            return fmt::format_to(ctx.out(), "Right({})", e.rightValue());
        }
    };

    template<typename A>
        requires fmt::is_formattable<A>::value
    struct formatter<prelude::seq<A>> {
        constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
            return ctx.begin();
        }

        template<typename FormatContext>
        auto format(const prelude::seq<A>& s, FormatContext& ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[{}]", fmt::join(s.begin(), s.end(), ", "));
        }
    };

}

namespace prelude {

    inline std::ostream& operator<<(std::ostream& out, const unit& u) {
        return out << fmt::format("{}", u);
    }

    template<typename A>
        requires fmt::is_formattable<option<A>>::value
    std::ostream& operator<<(std::ostream& out, const option<A>& o) {
        return out << fmt::format("{}", o);
    }

    template<typename L, typename R>
        requires fmt::is_formattable<either<L, R>>::value
    std::ostream& operator<<(std::ostream& out, const either<L, R>& e) {
        return out << fmt::format("{}", e);
    }

    template<typename A>
        requires fmt::is_formattable<seq<A>>::value
    std::ostream& operator<<(std::ostream& out, const seq<A>& s) {
        return out << fmt::format("{}", s);
    }

}
