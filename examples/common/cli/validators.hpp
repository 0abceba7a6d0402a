#pragma once

#include <cstdint>
#include <string>

#include <CLI/CLI.hpp>

#include "lcr/json.hpp"


namespace sequential::examples::cli {

// -------------------------------------------------------------
// Unsigned decimal validator (any width up to 128 bits)
// -------------------------------------------------------------
inline auto unsigned_validator = CLI::Validator(
    [](std::string& value) -> std::string {
#ifdef __SIZEOF_INT128__
        unsigned __int128 parsed{};
#else
        std::uint64_t parsed{};
#endif
        if (lcr::json::parse_unsigned(value, parsed)) {
            return {};
        }
        return "Value must be an unsigned decimal integer";
    },
    "Unsigned integer validator"
);


// -------------------------------------------------------------
// Integer width validator
// -------------------------------------------------------------
inline auto width_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "8" || value == "16" || value == "32" || value == "64") {
            return {};
        }
#ifdef __SIZEOF_INT128__
        if (value == "128") {
            return {};
        }
        return "Width must be one of: 8, 16, 32, 64, 128";
#else
        return "Width must be one of: 8, 16, 32, 64";
#endif
    },
    "Integer width validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal", "off"});

} // namespace sequential::examples::cli
