#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "sequential.hpp"
#include "sequential/codec/json.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

#include "common/cli/sequence_params.hpp"

using namespace sequential;

namespace {

template <SeqNum T>
[[nodiscard]]
bool parse_value(const std::string& text, const char* name, T& out) {
    if (lcr::json::parse_unsigned(text, out)) {
        return true;
    }
    SEQ_ERROR("[CLI] --" << name << " value " << text << " does not fit the selected width");
    return false;
}

// -----------------------------------------------------------------------------
// Builds the generator, produces values, prints the final state
// -----------------------------------------------------------------------------
template <SeqNum T>
int run(const examples::cli::Params& params) {
    Sequence<T> seq;

    if (!params.state.empty()) {
        auto r = codec::json::from_json(params.state, seq);
        if (r != codec::json::Result::Parsed) {
            SEQ_ERROR("[CLI] Cannot resume from state: " << codec::json::to_string(r));
            return EXIT_FAILURE;
        }
    }
    else {
        T start{};
        T step{};
        if (!parse_value(params.start, "start", start) || !parse_value(params.step, "step", step)) {
            return EXIT_FAILURE;
        }
        if (params.limit.empty()) {
            seq = Sequence<T>(start, step);
        }
        else {
            T limit{};
            if (!parse_value(params.limit, "limit", limit)) {
                return EXIT_FAILURE;
            }
            seq = Sequence<T>::bounded(start, limit, step);
        }
    }
    SEQ_INFO("[CLI] " << seq);

    T skip{};
    if (!parse_value(params.skip, "skip", skip)) {
        return EXIT_FAILURE;
    }
    if (skip != T{0}) {
        auto err = seq.fast_forward(skip);
        if (err != sequence::Error::None) {
            SEQ_WARN("[CLI] fast_forward(" << params.skip << ") rejected: " << sequence::to_string(err));
        }
    }

    std::size_t produced = 0;
    while (produced < params.count) {
        auto v = seq.next();
        if (!v.has()) {
            SEQ_INFO("[CLI] Sequence exhausted after " << produced << " value(s)");
            break;
        }
        std::cout << lcr::json::to_string(v.value()) << "\n";
        ++produced;
    }

    std::cout << codec::json::to_json(seq) << std::endl;
    return EXIT_SUCCESS;
}

} // namespace


// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "sequential - Sequence Generator Example\n"
        "Produces monotonic sequence numbers of a chosen width, with optional\n"
        "fast-forward and resumable JSON state.\n");

    params.dump("Parameters", std::clog);

    switch (params.width) {
        case 8:   return run<std::uint8_t>(params);
        case 16:  return run<std::uint16_t>(params);
        case 32:  return run<std::uint32_t>(params);
        case 64:  return run<std::uint64_t>(params);
#ifdef SEQUENTIAL_HAS_INT128
        case 128: return run<u128>(params);
#endif
        default:
            SEQ_ERROR("[CLI] Unsupported width " << params.width);
            return EXIT_FAILURE;
    }
}
