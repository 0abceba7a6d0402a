#pragma once

#include <cstdint>
#include <string_view>

namespace sequential {
namespace sequence {

/*
===============================================================================
 sequence::Error
===============================================================================

Outcome of fallible Sequence operations (fast_forward).

Exhaustion is NOT an error: it is reported by next() returning an empty
optional. Overflow is recoverable and leaves the sequence untouched, so the
caller may retry with a smaller skip or give up.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    Overflow,   // Result would exceed the maximum representable value
};


/// Optional helper for logging / diagnostics
[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:      return "None";
    case Error::Overflow:  return "Overflow";
    default:               return "Unknown";
    }
}

} // namespace sequence
} // namespace sequential
