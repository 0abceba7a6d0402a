#pragma once

#include <string_view>

#include "sequential/codec/json/result.hpp"
#include "sequential/codec/json/helpers.hpp"
#include "sequential/seq_num.hpp"
#include "sequential/state.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

/*
================================================================================
Sequence State JSON Parser
================================================================================

Schema:

  {
    "next":      <unsigned>,   required
    "incr":      <unsigned>,   required
    "max":       <unsigned>,   optional, defaults to the type maximum
    "start":     <unsigned>,   optional, defaults to "next"
    "exhausted": <bool>        optional, defaults to false
  }

<unsigned> is a JSON integer or a string of decimal digits. Values that do
not fit in the target type are rejected with InvalidValue.

Documents written before "start", "max" and "exhausted" existed
(e.g. {"next":88,"incr":11}) remain readable.

The output is only written when the whole document is valid.
================================================================================
*/

namespace sequential::codec::json {

template <SeqNum T>
struct state_parser {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, State<T>& out) noexcept {
        // Root must be an object
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            SEQ_WARN("[CODEC] Root not an object in sequence state -> rejected.");
            return r;
        }

        State<T> st{};

        // next (required)
        r = helper::parse_unsigned_required(root, "next", st.current);
        if (r != Result::Parsed) {
            SEQ_WARN("[CODEC] Field 'next' missing or invalid in sequence state (" << to_string(r) << ") -> rejected.");
            return r;
        }

        // incr (required)
        r = helper::parse_unsigned_required(root, "incr", st.step);
        if (r != Result::Parsed) {
            SEQ_WARN("[CODEC] Field 'incr' missing or invalid in sequence state (" << to_string(r) << ") -> rejected.");
            return r;
        }

        // max (optional)
        lcr::optional<T> limit;
        r = helper::parse_unsigned_optional(root, "max", limit);
        if (r != Result::Parsed) {
            SEQ_WARN("[CODEC] Field 'max' invalid in sequence state (" << to_string(r) << ") -> rejected.");
            return r;
        }
        st.limit = limit.value_or(seq_num_traits<T>::max_val());

        // start (optional)
        lcr::optional<T> start;
        r = helper::parse_unsigned_optional(root, "start", start);
        if (r != Result::Parsed) {
            SEQ_WARN("[CODEC] Field 'start' invalid in sequence state (" << to_string(r) << ") -> rejected.");
            return r;
        }
        st.start = start.value_or(st.current);

        // exhausted (optional)
        lcr::optional<bool> exhausted;
        r = helper::parse_bool_optional(root, "exhausted", exhausted);
        if (r != Result::Parsed) {
            SEQ_WARN("[CODEC] Field 'exhausted' invalid in sequence state -> rejected.");
            return r;
        }
        st.exhausted = exhausted.value_or(false);

        out = st;
        return Result::Parsed;
    }
};


template <SeqNum T>
[[nodiscard]]
inline Result parse(const simdjson::dom::element& root, State<T>& out) noexcept {
    return state_parser<T>::parse(root, out);
}

// Parses a JSON document into state.
// The parser instance is reused by the caller to avoid reallocations.
template <SeqNum T>
[[nodiscard]]
inline Result parse(simdjson::dom::parser& parser, std::string_view text, State<T>& out) noexcept {
    auto doc = parser.parse(text.data(), text.size());
    if (doc.error()) {
        SEQ_WARN("[CODEC] Malformed JSON in sequence state: " << simdjson::error_message(doc.error()));
        return Result::InvalidJson;
    }
    return state_parser<T>::parse(doc.value_unsafe(), out);
}

// Rebuilds a generator from its serialized state.
// On failure out is left unchanged.
template <Persistable S>
[[nodiscard]]
inline Result from_json(std::string_view text, S& out) {
    simdjson::dom::parser parser;
    State<typename S::value_type> st{};
    auto r = sequential::codec::json::parse(parser, text, st);
    if (r != Result::Parsed) {
        return r;
    }
    out = S::from_state(st);
    return Result::Parsed;
}

} // namespace sequential::codec::json
