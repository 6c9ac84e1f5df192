#include <cstdio>
#include <future>
#include <map>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <cxxprelude/cxxprelude.hpp>

namespace {

    const std::map<std::string, int> ports = {
        {"http", 80},
        {"https", 443},
        {"ssh", 22},
    };

    // Looks a service up on another thread
    prelude::option_async<int> lookup(std::string name) {
        auto pending = prelude::task<prelude::option<int>>::delay([name]() {
            auto found = ports.find(name);
            if(found == ports.end()) return prelude::option<int>();
            return prelude::option<int>(found->second);
        });
        return prelude::option_async<int>(pending);
    }

}

int main(int argc, char** argv) {
    try {
        prelude::configure(prelude::runtime_config::from_environment());
    } catch(const prelude::config_error& e) {
        fmt::print(stderr, "cxxprelude_demo: {}\n", e.what());
        return 2;
    }

    prelude::seq<std::string> names = argc > 1
        ? prelude::seq<std::string>(std::vector<std::string>(argv + 1, argv + argc))
        : prelude::make_seq(std::string("http"), std::string("ssh"));

    prelude::seq<prelude::option_async<int>> lookups = names.map(lookup);
    prelude::option_async<prelude::seq<int>> all = prelude::sequence(lookups);

    std::future<prelude::option<prelude::seq<int>>> result = all.toOption().unsafeRunAsync();
    prelude::option<prelude::seq<int>> found = result.get();

    fmt::print("{} -> {}\n", names, found);
    if(found.isNone()) {
        prelude::log::warn("{} of {} services could not be resolved",
                           names.filter([](const std::string& name) { return ports.count(name) == 0; }).size(),
                           names.size());
        return 1;
    }
    return 0;
}
