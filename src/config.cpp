#include <cstdlib>
#include <mutex>
#include <string>

#include <fmt/core.h>

#include <cxxprelude/config.hpp>
#include <cxxprelude/errors.hpp>

namespace prelude {

    namespace {
        std::mutex settings_mutex;
        runtime_config settings;
    }

    runtime_config runtime_config::from_environment() {
        runtime_config result;
        if(const char* launch = std::getenv("CXXPRELUDE_LAUNCH")) {
            result.launch_policy = parse_launch_policy(launch);
        }
        if(const char* level = std::getenv("CXXPRELUDE_LOG")) {
            result.level = parse_log_level(level);
        }
        return result;
    }

    runtime_config config() {
        std::lock_guard<std::mutex> lock(settings_mutex);
        return settings;
    }

    void configure(const runtime_config& next) {
        std::lock_guard<std::mutex> lock(settings_mutex);
        settings = next;
    }

    log_level parse_log_level(std::string_view name) {
        if(name == "trace") return log_level::trace;
        if(name == "debug") return log_level::debug;
        if(name == "info") return log_level::info;
        if(name == "warn") return log_level::warn;
        if(name == "error") return log_level::error;
        if(name == "off") return log_level::off;
        throw config_error(fmt::format("unknown log level '{}'", name));
    }

    std::launch parse_launch_policy(std::string_view name) {
        if(name == "async") return std::launch::async;
        if(name == "deferred") return std::launch::deferred;
        throw config_error(fmt::format("unknown launch policy '{}'", name));
    }

    std::string_view to_string(log_level level) {
        switch(level) {
            case log_level::trace: return "trace";
            case log_level::debug: return "debug";
            case log_level::info: return "info";
            case log_level::warn: return "warn";
            case log_level::error: return "error";
            case log_level::off: return "off";
        }
        return "unknown";
    }

}
