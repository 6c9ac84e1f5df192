#include <cstdio>
#include <mutex>
#include <utility>

#include <fmt/core.h>

#include <cxxprelude/log.hpp>

namespace prelude::log {

    namespace {
        std::mutex sink_mutex;
        sink active;

        void write_stderr(log_level level, std::string_view message) {
            fmt::print(stderr, "[cxxprelude] [{}] {}\n", to_string(level), message);
        }
    }

    bool enabled(log_level level) {
        const log_level threshold = config().level;
        return threshold != log_level::off && level >= threshold;
    }

    // The sink runs without sink_mutex held so it may log or replace itself
    void emit(log_level level, std::string_view message) {
        sink current;
        {
            std::lock_guard<std::mutex> lock(sink_mutex);
            current = active;
        }
        if(current) {
            current(level, message);
        } else {
            write_stderr(level, message);
        }
    }

    void set_sink(sink next) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        active = std::move(next);
    }

}
