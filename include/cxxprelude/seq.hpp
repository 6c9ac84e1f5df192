#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <cxxprelude/errors.hpp>
#include <cxxprelude/kind.hpp>

namespace prelude {

    // Converts to the empty seq<A>, for any A
    struct empty_t {
        constexpr bool operator==(const empty_t&) const = default;
    };

    inline constexpr empty_t empty{};

    // Immutable ordered sequence. Copies share their elements; every
    // operation that changes the contents builds a new sequence.
    template<typename A>
    class seq final {
        std::shared_ptr<const std::vector<A>> internal;

        static const std::vector<A>& nothing() {
            static const std::vector<A> none;
            return none;
        }

        const std::vector<A>& items() const {
            return internal ? *internal : nothing();
        }

        public:
        using value_type = A;
        using const_iterator = typename std::vector<A>::const_iterator;

        seq() = default;
        seq(empty_t) {}
        seq(std::vector<A> items) : internal(std::make_shared<const std::vector<A>>(std::move(items))) {}
        seq(std::initializer_list<A> items) : seq(std::vector<A>(items)) {}

        const_iterator begin() const {
            return items().begin();
        }

        const_iterator end() const {
            return items().end();
        }

        std::size_t size() const {
            return items().size();
        }

        bool isEmpty() const {
            return items().empty();
        }

        const A& operator[](std::size_t index) const {
            return items().at(index);
        }

        const A& head() const {
            if(isEmpty()) throw empty_sequence();
            return items().front();
        }

        seq tail() const {
            if(isEmpty()) return seq();
            return seq(std::vector<A>(begin() + 1, end()));
        }

        seq add(A a) const {
            std::vector<A> next = items();
            next.push_back(std::move(a));
            return seq(std::move(next));
        }

        seq concat(const seq& other) const {
            if(isEmpty()) return other;
            if(other.isEmpty()) return *this;
            std::vector<A> next = items();
            next.insert(next.end(), other.begin(), other.end());
            return seq(std::move(next));
        }

        template<typename F>
            requires std::invocable<F, const A&>
        auto map(F f) const -> seq<std::invoke_result_t<F, const A&>> {
            using B = std::invoke_result_t<F, const A&>;
            std::vector<B> out;
            out.reserve(size());
            for(const A& a : items()) {
                out.push_back(std::invoke(f, a));
            }
            return seq<B>(std::move(out));
        }

        template<typename F>
            requires std::invocable<F, const A&>
        auto flatMap(F f) const -> std::invoke_result_t<F, const A&> {
            using SB = std::invoke_result_t<F, const A&>;
            std::vector<typename SB::value_type> out;
            for(const A& a : items()) {
                SB chunk = std::invoke(f, a);
                out.insert(out.end(), chunk.begin(), chunk.end());
            }
            return SB(std::move(out));
        }

        template<typename P>
        seq filter(P pred) const {
            std::vector<A> out;
            for(const A& a : items()) {
                if(std::invoke(pred, a)) out.push_back(a);
            }
            return seq(std::move(out));
        }

        template<typename S, typename F>
        S fold(S state, F folder) const {
            for(const A& a : items()) {
                state = std::invoke(folder, std::move(state), a);
            }
            return state;
        }

        template<typename S, typename F>
        S foldBack(S state, F folder) const {
            for(auto it = items().rbegin(); it != items().rend(); ++it) {
                state = std::invoke(folder, std::move(state), *it);
            }
            return state;
        }

        const std::vector<A>& toVector() const {
            return items();
        }

        friend bool operator==(const seq& a, const seq& b) {
            return a.items() == b.items();
        }
    };

    template<typename A>
    seq<std::decay_t<A>> seq1(A&& value) {
        return seq<std::decay_t<A>>({std::forward<A>(value)});
    }

    template<typename A, typename... As>
    seq<std::decay_t<A>> make_seq(A&& first, As&&... rest) {
        std::vector<std::decay_t<A>> items;
        items.reserve(1 + sizeof...(As));
        items.push_back(std::forward<A>(first));
        (items.push_back(std::forward<As>(rest)), ...);
        return seq<std::decay_t<A>>(std::move(items));
    }

}
