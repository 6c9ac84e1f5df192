#pragma once

#include <future>
#include <string_view>

namespace prelude {

    enum class log_level {
        trace,
        debug,
        info,
        warn,
        error,
        off
    };

    // Process-wide settings for the runtime parts of the library
    struct runtime_config {
        // How task::unsafeRunAsync hands work to std::async
        std::launch launch_policy = std::launch::async;
        // Messages below this level are dropped
        log_level level = log_level::warn;

        // Reads CXXPRELUDE_LAUNCH and CXXPRELUDE_LOG, keeping the default
        // for whichever is unset. Throws config_error on unknown values.
        static runtime_config from_environment();
    };

    // A snapshot of the current settings
    runtime_config config();

    void configure(const runtime_config& settings);

    log_level parse_log_level(std::string_view name);
    std::launch parse_launch_policy(std::string_view name);

    std::string_view to_string(log_level level);

}
