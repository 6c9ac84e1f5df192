#include <atomic>
#include <functional>
#include <string>
#include <type_traits>
#include <vector>

#include <catch2/catch.hpp>
#include <fmt/core.h>

#include <cxxprelude/cxxprelude.hpp>

using prelude::option;
using prelude::option_async;
using prelude::task;
using prelude::unit;

namespace {

    // Some(value) that is only known once a task has run
    option_async<int> later(int value) {
        return option_async<int>(task<option<int>>::delay([value]() { return option<int>(value); }));
    }

    option_async<int> laterNone() {
        return option_async<int>(task<option<int>>::delay([]() { return option<int>(); }));
    }

    template<typename A>
    option<A> run(const option_async<A>& ma) {
        return ma.toOption().unsafeRunSync();
    }

}

TEST_CASE("option_async construction", "[option_async]") {
    SECTION("Known states") {
        REQUIRE(run(prelude::some_async(1)) == prelude::some(1));
        REQUIRE(run(option_async<int>::None).isNone());
        REQUIRE(run(option_async<int>(prelude::none)).isNone());
        REQUIRE(run(option_async<int>(prelude::some(2))) == prelude::some(2));
        REQUIRE_FALSE(prelude::some_async(1).isLazy());
    }

    SECTION("From pending work") {
        REQUIRE(later(3).isLazy());
        REQUIRE(run(later(3)) == prelude::some(3));
        REQUIRE(run(option_async<int>(task<int>::delay([]() { return 4; }))) == prelude::some(4));
    }

    SECTION("From a range") {
        REQUIRE(run(option_async<int>::from(std::vector<int>{5, 6})) == prelude::some(5));
        REQUIRE(run(option_async<int>::from(std::vector<int>())).isNone());
    }

    SECTION("Queries") {
        REQUIRE(later(1).isSome().unsafeRunSync());
        REQUIRE(laterNone().isNone().unsafeRunSync());
        REQUIRE(later(7).value().unsafeRunSync() == 7);
        REQUIRE_THROWS_AS(laterNone().value().unsafeRunSync(), prelude::value_is_none);
    }
}

TEST_CASE("option_async defers its work", "[option_async]") {
    std::atomic<int> runs{0};
    auto ma = option_async<int>(task<option<int>>::delay([&runs]() {
        ++runs;
        return option<int>(1);
    }));
    auto mb = ma.map([&runs](int x) {
        ++runs;
        return x + 1;
    });
    REQUIRE(runs.load() == 0);
    REQUIRE(run(mb) == prelude::some(2));
    REQUIRE(runs.load() == 2);
}

TEST_CASE("option_async map and bind", "[option_async]") {
    SECTION("Synchronous map") {
        REQUIRE(run(later(2).map([](int x) { return x * 10; })) == prelude::some(20));
        REQUIRE(run(laterNone().map([](int x) { return x * 10; })).isNone());
        REQUIRE(run(later(2).select([](int x) { return std::to_string(x); })) == prelude::some(std::string("2")));
    }

    SECTION("Asynchronous map") {
        auto mb = later(2).map([](int x) { return task<int>::delay([x]() { return x + 5; }); });
        REQUIRE(run(mb) == prelude::some(7));
    }

    SECTION("bind") {
        auto half = [](int x) { return x % 2 == 0 ? later(x / 2) : option_async<int>::None; };
        REQUIRE(run(later(8).bind(half)) == prelude::some(4));
        REQUIRE(run(later(3).bind(half)).isNone());
        REQUIRE(run(laterNone().bind(half)).isNone());
    }

    SECTION("selectMany projects both values") {
        auto mc = later(3).selectMany([](int x) { return later(x + 1); }, [](int a, int b) { return a * b; });
        REQUIRE(run(mc) == prelude::some(12));
    }

    SECTION("The generic functions accept option_async") {
        REQUIRE(run(prelude::fmap(later(1), [](int x) { return x - 1; })) == prelude::some(0));
        REQUIRE(run(prelude::pure<prelude::option_async_tag>(9)) == prelude::some(9));
        REQUIRE(prelude::count(later(1)).unsafeRunSync() == 1);
    }
}

TEST_CASE("option_async match", "[option_async]") {
    auto syncSome = [](int x) { return fmt::format("some {}", x); };
    auto asyncSome = [](int x) { return task<std::string>::pure(fmt::format("some {}", x)); };
    auto syncNone = []() { return std::string("none"); };
    auto asyncNone = []() { return task<std::string>::delay([]() { return std::string("none"); }); };

    SECTION("Both arms synchronous") {
        REQUIRE(later(1).match(syncSome, syncNone).unsafeRunSync() == "some 1");
        REQUIRE(laterNone().match(syncSome, syncNone).unsafeRunSync() == "none");
    }

    SECTION("Asynchronous Some arm") {
        REQUIRE(later(2).match(asyncSome, syncNone).unsafeRunSync() == "some 2");
        REQUIRE(laterNone().match(asyncSome, syncNone).unsafeRunSync() == "none");
    }

    SECTION("Asynchronous None arm") {
        REQUIRE(later(3).match(syncSome, asyncNone).unsafeRunSync() == "some 3");
        REQUIRE(laterNone().match(syncSome, asyncNone).unsafeRunSync() == "none");
    }

    SECTION("Both arms asynchronous") {
        REQUIRE(later(4).match(asyncSome, asyncNone).unsafeRunAsync().get() == "some 4");
        REQUIRE(laterNone().match(asyncSome, asyncNone).unsafeRunAsync().get() == "none");
    }

    SECTION("Actions give unit") {
        int seen = 0;
        task<unit> done = later(5).match([&seen](int x) { seen = x; }, [&seen]() { seen = -1; });
        REQUIRE(seen == 0);
        REQUIRE(done.unsafeRunSync() == unit{});
        REQUIRE(seen == 5);
        laterNone().match([&seen](int x) { seen = x; }, [&seen]() { seen = -1; }).unsafeRunSync();
        REQUIRE(seen == -1);
    }
}

TEST_CASE("option_async ifSome and ifNone", "[option_async]") {
    SECTION("ifSome runs actions and tasks") {
        int seen = 0;
        later(6).ifSome([&seen](int x) { seen = x; }).unsafeRunSync();
        REQUIRE(seen == 6);
        later(7).ifSome([&seen](int x) { return task<int>::delay([&seen, x]() { return seen = x; }); }).unsafeRunSync();
        REQUIRE(seen == 7);
        laterNone().ifSome([&seen](int) { seen = -1; }).unsafeRunSync();
        REQUIRE(seen == 7);
    }

    SECTION("ifNone takes a value, a thunk or a task thunk") {
        REQUIRE(laterNone().ifNone(1).unsafeRunSync() == 1);
        REQUIRE(laterNone().ifNone([]() { return 2; }).unsafeRunSync() == 2);
        REQUIRE(laterNone().ifNone([]() { return task<int>::pure(3); }).unsafeRunSync() == 3);
        REQUIRE(later(4).ifNone(1).unsafeRunSync() == 4);
    }

    SECTION("ifNone keeps a callable fallback as the value") {
        using fn = std::function<int ()>;
        const fn seven = []() { return 7; };
        fn picked = option_async<fn>::None.ifNone(seven).unsafeRunSync();
        REQUIRE(picked() == 7);
        fn kept = option_async<fn>(fn([]() { return 1; })).ifNone(seven).unsafeRunSync();
        REQUIRE(kept() == 1);
    }
}

TEST_CASE("option_async folds", "[option_async]") {
    auto add = [](int s, int x) { return s + x; };
    auto addLater = [](int s, int x) { return task<int>::delay([s, x]() { return s + x; }); };

    SECTION("fold and foldBack") {
        REQUIRE(later(2).fold(10, add).unsafeRunSync() == 12);
        REQUIRE(later(2).fold(10, addLater).unsafeRunSync() == 12);
        REQUIRE(laterNone().fold(10, add).unsafeRunSync() == 10);
        REQUIRE(later(2).foldBack(1, addLater).unsafeRunSync() == 3);
    }

    SECTION("biFold with every combination of arms") {
        auto noneSync = [](int s) { return s - 1; };
        auto noneUnit = [](int s, unit) { return s * 2; };
        auto noneAsync = [](int s) { return task<int>::pure(s - 100); };
        auto noneUnitAsync = [](int s, unit) { return task<int>::pure(s * 3); };

        REQUIRE(later(5).biFold(1, add, noneSync).unsafeRunSync() == 6);
        REQUIRE(later(5).biFold(1, addLater, noneAsync).unsafeRunSync() == 6);
        REQUIRE(laterNone().biFold(1, add, noneSync).unsafeRunSync() == 0);
        REQUIRE(laterNone().biFold(1, add, noneUnit).unsafeRunSync() == 2);
        REQUIRE(laterNone().biFold(1, addLater, noneAsync).unsafeRunSync() == -99);
        REQUIRE(laterNone().biFold(1, addLater, noneUnitAsync).unsafeRunSync() == 3);
    }

    SECTION("count") {
        REQUIRE(later(1).count().unsafeRunSync() == 1);
        REQUIRE(laterNone().count().unsafeRunSync() == 0);
    }
}

TEST_CASE("option_async biMap", "[option_async]") {
    REQUIRE(run(later(3).biMap([](int x) { return x * 2; }, []() { return 0; })) == prelude::some(6));
    REQUIRE(run(laterNone().biMap([](int x) { return x * 2; }, []() { return 0; })) == prelude::some(0));
    REQUIRE(run(laterNone().biMap([](int x) { return x * 2; }, [](unit) { return task<int>::pure(-1); }))
            == prelude::some(-1));
}

TEST_CASE("option_async predicates", "[option_async]") {
    auto positive = [](int x) { return x > 0; };
    auto positiveLater = [](int x) { return task<bool>::pure(x > 0); };

    SECTION("forAll is true for None") {
        REQUIRE(later(1).forAll(positive).unsafeRunSync());
        REQUIRE_FALSE(later(-1).forAll(positiveLater).unsafeRunSync());
        REQUIRE(laterNone().forAll(positive).unsafeRunSync());
    }

    SECTION("exists is false for None") {
        REQUIRE(later(1).exists(positiveLater).unsafeRunSync());
        REQUIRE_FALSE(later(-1).exists(positive).unsafeRunSync());
        REQUIRE_FALSE(laterNone().exists(positive).unsafeRunSync());
    }

    SECTION("biForAll and biExists consult the None arm") {
        REQUIRE_FALSE(laterNone().biForAll(positive, []() { return false; }).unsafeRunSync());
        REQUIRE(laterNone().biExists(positive, [](unit) { return true; }).unsafeRunSync());
        REQUIRE(later(2).biExists(positiveLater, []() { return false; }).unsafeRunSync());
    }
}

TEST_CASE("option_async iteration", "[option_async]") {
    std::vector<std::string> calls;
    auto onSome = [&calls](int x) { calls.push_back(fmt::format("some {}", x)); };
    auto onNone = [&calls]() { calls.push_back("none"); };

    later(1).iter(onSome).unsafeRunSync();
    later(2).biIter(onSome, onNone).unsafeRunSync();
    laterNone().biIter(onSome, onNone).unsafeRunSync();
    laterNone().iter(onSome).unsafeRunSync();

    REQUIRE(calls == std::vector<std::string>{"some 1", "some 2", "none"});
}

TEST_CASE("option_async filter and join", "[option_async]") {
    SECTION("filter with a plain predicate") {
        REQUIRE(run(later(4).filter([](int x) { return x % 2 == 0; })) == prelude::some(4));
        REQUIRE(run(later(3).where([](int x) { return x % 2 == 0; })).isNone());
    }

    SECTION("filter with a task predicate") {
        auto evenLater = [](int x) { return task<bool>::delay([x]() { return x % 2 == 0; }); };
        REQUIRE(run(later(4).filter(evenLater)) == prelude::some(4));
        REQUIRE(run(later(5).filter(evenLater)).isNone());
        REQUIRE(run(laterNone().filter(evenLater)).isNone());
    }

    SECTION("join matches on keys") {
        auto user = later(7);
        auto order = option_async<std::string>(std::string("7:book"));
        auto key = [](const std::string& s) { return std::stoi(s.substr(0, s.find(':'))); };
        auto describe = [](int id, const std::string& s) { return fmt::format("user {} ordered {}", id, s.substr(2)); };

        auto joined = user.join(order, [](int id) { return id; }, key, describe);
        REQUIRE(run(joined) == prelude::some(std::string("user 7 ordered book")));

        auto mismatched = later(8).join(order, [](int id) { return id; }, key, describe);
        REQUIRE(run(mismatched).isNone());
    }
}

TEST_CASE("option_async partial application", "[option_async]") {
    SECTION("Two arguments") {
        auto partial = later(10).parMap<int>([](int a, int b) { return a - b; });
        auto f = run(partial).value();
        REQUIRE(f(4) == 6);
    }

    SECTION("Three arguments") {
        auto partial = later(1).parMap<int, int>([](int a, int b, int c) { return a + b * c; });
        auto f = run(partial).value();
        REQUIRE(f(2)(3) == 7);
    }

    SECTION("None stays None") {
        REQUIRE(run(laterNone().parMap<int>([](int a, int b) { return a + b; })).isNone());
    }
}

TEST_CASE("option_async conversions", "[option_async]") {
    SECTION("toSeq") {
        REQUIRE(later(1).toSeq().unsafeRunSync() == prelude::seq1(1));
        REQUIRE(laterNone().toSeq().unsafeRunSync().isEmpty());
    }

    SECTION("toEither with a value or a thunk") {
        auto right = later(1).toEither(std::string("missing")).unsafeRunSync();
        REQUIRE(right.rightValue() == 1);
        auto left = laterNone().toEither(std::string("missing")).unsafeRunSync();
        REQUIRE(left.leftValue() == "missing");
        auto lazyLeft = laterNone().toEither([]() { return std::string("computed"); }).unsafeRunSync();
        REQUIRE(lazyLeft.leftValue() == "computed");
        auto named = laterNone().toEither<std::string>([]() { return "named"; }).unsafeRunSync();
        REQUIRE(named.leftValue() == "named");
    }

    SECTION("toEither with a callable Left named explicitly") {
        using fn = std::function<std::string ()>;
        int calls = 0;
        const fn describe = [&calls]() {
            ++calls;
            return std::string("described");
        };
        auto left = laterNone().toEither<fn>(describe).unsafeRunSync();
        STATIC_REQUIRE((std::is_same_v<decltype(left), prelude::either<fn, int>>));
        REQUIRE(calls == 0);
        REQUIRE(left.isLeft());
        REQUIRE(left.leftValue()() == "described");
        REQUIRE(calls == 1);
        REQUIRE(later(2).toEither<fn>(describe).unsafeRunSync().rightValue() == 2);
    }

    SECTION("toVector") {
        REQUIRE(later(3).toVector().unsafeRunSync() == std::vector<int>{3});
        REQUIRE(laterNone().toVector().unsafeRunSync().empty());
        REQUIRE(option_async<std::string>(prelude::some(std::string("a"))).toVector().unsafeRunSync()
                == std::vector<std::string>{"a"});
    }

    SECTION("toString and hash wait for the value") {
        REQUIRE(later(5).toString() == "Some(5)");
        REQUIRE(laterNone().toString() == "None");
        REQUIRE(later(5).hash() == std::hash<option<int>>()(prelude::some(5)));
        REQUIRE(laterNone().hash() == 0u);
    }

    SECTION("Coalescing picks the first Some") {
        REQUIRE(run(laterNone() | later(2)) == prelude::some(2));
        REQUIRE(run(later(1) | later(2)) == prelude::some(1));
        REQUIRE(run(laterNone() | option_async<int>::None).isNone());
    }
}
