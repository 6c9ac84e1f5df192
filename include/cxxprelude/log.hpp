#pragma once

#include <functional>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include <cxxprelude/config.hpp>

namespace prelude::log {

    using sink = std::function<void (log_level, std::string_view)>;

    // True if a message at this level passes the configured threshold
    bool enabled(log_level level);

    // Hands an already formatted message to the active sink
    void emit(log_level level, std::string_view message);

    // Replaces the sink. An empty sink restores the stderr writer.
    void set_sink(sink next);

    template<typename... Args>
    void write(log_level level, fmt::format_string<Args...> format, Args&&... args) {
        if(!enabled(level)) return;
        emit(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        write(log_level::trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        write(log_level::debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        write(log_level::warn, format, std::forward<Args>(args)...);
    }

}
