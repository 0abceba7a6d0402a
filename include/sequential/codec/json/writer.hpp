#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "sequential/seq_num.hpp"
#include "sequential/state.hpp"
#include "lcr/json.hpp"


namespace sequential::codec::json {

// -----------------------------------------------------------------------------
// Output format (stable field order):
//
//   {"start":<v>,"next":<v>,"incr":<v>,"max":<v>,"exhausted":<bool>}
//
// Values wider than 64 bits are written as decimal strings so that any JSON
// reader can carry them; narrower values are plain JSON integers.
// -----------------------------------------------------------------------------

template <SeqNum T>
inline constexpr bool quoted_values_v = sizeof(T) > sizeof(std::uint64_t);

// Number of decimal digits of the maximum value of T
template <SeqNum T>
[[nodiscard]]
inline constexpr std::size_t max_digits() noexcept {
    T v = seq_num_traits<T>::max_val();
    std::size_t n = 1;
    while (v >= 10) {
        v = static_cast<T>(v / 10);
        ++n;
    }
    return n;
}

template <SeqNum T>
[[nodiscard]]
inline constexpr std::size_t max_json_size() noexcept {
    // Worst case ({"start":..,"next":..,"incr":..,"max":..,"exhausted":false}):
    //   fixed text: 9 + 8 + 8 + 7 + 13 + 5 + 1 = 51 bytes
    //   4 values, each optionally quoted
    constexpr std::size_t value_size = max_digits<T>() + (quoted_values_v<T> ? 2 : 0);
    return 51 + 4 * value_size;
}


namespace detail {

template <std::size_t N>
inline std::size_t put(char* buffer, const char (&text)[N]) noexcept {
    std::memcpy(buffer, text, N - 1);
    return N - 1;
}

template <SeqNum T>
inline std::size_t put_value(char* buffer, T value) noexcept {
    std::size_t pos = 0;
    if constexpr (quoted_values_v<T>) {
        buffer[pos++] = '"';
    }
    pos += lcr::json::append(buffer + pos, value);
    if constexpr (quoted_values_v<T>) {
        buffer[pos++] = '"';
    }
    return pos;
}

} // namespace detail


// Writes JSON into raw buffer.
// Returns number of bytes written.
// PRECONDITION: buffer_size >= max_json_size<T>()
template <SeqNum T>
[[nodiscard]]
inline std::size_t write_json(const State<T>& st, char* buffer) noexcept {
    std::size_t pos = 0;

    pos += detail::put(buffer + pos, "{\"start\":");
    pos += detail::put_value(buffer + pos, st.start);

    pos += detail::put(buffer + pos, ",\"next\":");
    pos += detail::put_value(buffer + pos, st.current);

    pos += detail::put(buffer + pos, ",\"incr\":");
    pos += detail::put_value(buffer + pos, st.step);

    pos += detail::put(buffer + pos, ",\"max\":");
    pos += detail::put_value(buffer + pos, st.limit);

    pos += detail::put(buffer + pos, ",\"exhausted\":");
    pos += st.exhausted ? detail::put(buffer + pos, "true") : detail::put(buffer + pos, "false");

    buffer[pos++] = '}';

    assert(pos <= max_json_size<T>());

    return pos;
}

template <Persistable S>
[[nodiscard]]
inline std::size_t write_json(const S& seq, char* buffer) noexcept {
    return write_json(seq.state(), buffer);
}

#ifndef SEQUENTIAL_NO_ALLOCATIONS
// Convenience method (allocating) for tests / logging.
template <SeqNum T>
[[nodiscard]]
inline std::string to_json(const State<T>& st) {
    char buffer[max_json_size<T>()];
    std::size_t size = write_json(st, buffer);
    return std::string(buffer, size);
}

template <Persistable S>
[[nodiscard]]
inline std::string to_json(const S& seq) {
    return to_json(seq.state());
}
#endif // SEQUENTIAL_NO_ALLOCATIONS

} // namespace sequential::codec::json
