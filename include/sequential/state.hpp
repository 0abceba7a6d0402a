#pragma once

#include <concepts>

#include "sequential/seq_num.hpp"

namespace sequential {

// -----------------------------------------------------------------------------
// Persisted field set of a Sequence.
//
// Encoding these fields and rebuilding the generator from them yields the
// same next production and the same exhaustion status.
// -----------------------------------------------------------------------------
template <SeqNum T>
struct State {
    T start{};
    T current{};
    T step{};
    T limit{seq_num_traits<T>::max_val()};
    bool exhausted{false};

    [[nodiscard]] friend constexpr bool operator==(const State&, const State&) = default;
};


// A type whose state can be captured and restored through State<value_type>.
// Codecs are written against this concept, never against Sequence itself.
template <typename S>
concept Persistable =
    SeqNum<typename S::value_type> &&
    requires(const S& s, const State<typename S::value_type>& st) {
        { s.state() } noexcept -> std::same_as<State<typename S::value_type>>;
        { S::from_state(st) } noexcept -> std::same_as<S>;
    };

} // namespace sequential
