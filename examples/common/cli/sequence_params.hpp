#pragma once

#include <string>
#include <ostream>
#include <iostream>
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "lcr/log/logger.hpp"

namespace sequential::examples::cli {

// Numeric options are kept as decimal text so that every width (128-bit
// included) goes through the same parser once the width is known.
struct Params {
    std::string start     = "0";
    std::string step      = "1";
    std::string limit     = "";      // empty -> type maximum
    std::string skip      = "0";
    std::string state     = "";      // JSON state to resume from
    unsigned    width     = 64;
    std::size_t count     = 10;
    std::string log_level = "warn";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Width     : u" << width << "\n";
        if (state.empty()) {
            os << "  Start     : " << start << "\n"
               << "  Step      : " << step << "\n"
               << "  Limit     : " << (limit.empty() ? "<type max>" : limit) << "\n";
        }
        else {
            os << "  State     : " << state << "\n";
        }
        os << "  Skip      : " << skip << "\n"
           << "  Count     : " << count << "\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--start", params.start, "First value produced")->check(unsigned_validator)->default_val(params.start);
    app.add_option("--step", params.step, "Increment between values (0 = constant)")->check(unsigned_validator)->default_val(params.step);
    app.add_option("--limit", params.limit, "Inclusive upper limit (default: type maximum)")->check(unsigned_validator);
    app.add_option("--skip", params.skip, "Fast-forward by this amount before producing")->check(unsigned_validator)->default_val(params.skip);
    app.add_option("--count", params.count, "Maximum number of values to produce")->default_val(params.count);
    app.add_option("-w,--width", params.width, "Integer width in bits")->check(width_validator)->default_val(params.width);
    auto* state_opt = app.add_option("--state", params.state, "Resume from a JSON state (as printed by a previous run)");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal | off")
        ->check(log_level_validator)->default_val(params.log_level);

    state_opt->excludes("--start")->excludes("--step")->excludes("--limit");

    app.footer(
        "Produces at most <count> values and prints the final state as JSON.\n"
        "Feed that JSON back with --state to continue where the run stopped."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(lcr::log::parse_level(params.log_level));
    return params;
}

} // namespace sequential::examples::cli
