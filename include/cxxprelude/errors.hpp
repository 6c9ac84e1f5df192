#pragma once

#include <stdexcept>
#include <string>

namespace prelude {

    // Root of every error the library raises itself
    class error : public std::runtime_error {
        public:
        using std::runtime_error::runtime_error;
    };

    class value_is_none final : public error {
        public:
        value_is_none() : error("option is in a None state") {}
    };

    class value_is_left final : public error {
        public:
        value_is_left() : error("either is in a Left state") {}
    };

    class value_is_right final : public error {
        public:
        value_is_right() : error("either is in a Right state") {}
    };

    class empty_sequence final : public error {
        public:
        empty_sequence() : error("sequence is empty") {}
    };

    class config_error final : public error {
        public:
        explicit config_error(const std::string& what) : error(what) {}
    };

}
