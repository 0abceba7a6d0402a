#pragma once

#include <cstdint>
#include <string_view>

#include "sequential/codec/json/result.hpp"
#include "sequential/seq_num.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
State JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the state parser to extract primitive values from
simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse unsigned values of any supported width, either as JSON integers or
    as decimal strings (required for 128-bit values)
  • Provide strict optional-field handling semantics

IMPORTANT:
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions
  - Required-field helpers leave the output untouched on failure

================================================================================
*/


namespace sequential::codec::json::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ============================================================================
// UNSIGNED VALUE
// ============================================================================
//
// Accepts:
//   • JSON unsigned integer  -> must fit in T
//   • JSON string of digits  -> must fit in T
// Anything else is InvalidSchema; a value too large for T is InvalidValue.
//
template <SeqNum T>
[[nodiscard]]
inline Result parse_unsigned(const simdjson::dom::element& field, T& out) noexcept {
    switch (field.type()) {
        case simdjson::dom::element_type::UINT64:
        case simdjson::dom::element_type::INT64: {
            std::uint64_t raw{};
            if (field.get(raw)) {
                return Result::InvalidSchema; // negative integer
            }
            if (raw > seq_num_traits<T>::max_val()) {
                return Result::InvalidValue;
            }
            out = static_cast<T>(raw);
            return Result::Parsed;
        }
        case simdjson::dom::element_type::STRING: {
            std::string_view sv;
            if (field.get(sv)) {
                return Result::InvalidSchema;
            }
            if (sv.empty()) {
                return Result::InvalidSchema;
            }
            for (char c : sv) {
                if (c < '0' || c > '9') {
                    return Result::InvalidSchema;
                }
            }
            // Digits only: the remaining failure is overflow
            T tmp{};
            if (!lcr::json::parse_unsigned(sv, tmp)) {
                return Result::InvalidValue;
            }
            out = tmp;
            return Result::Parsed;
        }
        default:
            return Result::InvalidSchema;
    }
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

template <SeqNum T>
[[nodiscard]]
inline Result parse_unsigned_required(const simdjson::dom::element& obj, const char* key, T& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    return parse_unsigned(field.value_unsafe(), out);
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

template <SeqNum T>
[[nodiscard]]
inline Result parse_unsigned_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<T>& out) noexcept {
    // Always reset output
    out.reset();
    // Parent must be an object
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    T tmp{};
    auto r = parse_unsigned(field.value_unsafe(), tmp);
    if (r != Result::Parsed) {
        return r;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    // Always reset output
    out.reset();
    // Parent must be an object
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    // Extract boolean
    bool tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

} // namespace sequential::codec::json::helper
