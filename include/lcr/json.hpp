#pragma once

#include <string>
#include <string_view>
#include <cstddef>
#include <cstdint>
#include <type_traits>


namespace lcr {
namespace json {

// Largest decimal representation of a supported unsigned value:
// 340282366920938463463374607431768211455 (2^128 - 1) -> 39 digits
inline constexpr std::size_t max_unsigned_digits = 39;

template <typename T>
inline constexpr bool is_unsigned_value_v =
    std::is_unsigned_v<T> && !std::is_same_v<T, bool>
#ifdef __SIZEOF_INT128__
    || std::is_same_v<T, unsigned __int128>
#endif
    ;


// Fast unsigned integer -> decimal formatter.
// Writes into a raw buffer and returns the number of bytes written.
// PRECONDITION: buffer has room for max_unsigned_digits bytes.
template <typename T>
[[nodiscard]]
inline std::size_t append(char* out, T value) noexcept {
    static_assert(is_unsigned_value_v<T>, "lcr::json::append requires an unsigned integer");

    char buf[max_unsigned_digits];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + static_cast<unsigned>(value % 10));
        value /= 10;
    } while (value > 0);

    const std::size_t n = static_cast<std::size_t>(buf + sizeof(buf) - p);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = p[i];
    }
    return n;
}

// Allocating variant (tests / logging)
template <typename T>
inline void append(std::string& out, T value) {
    char buf[max_unsigned_digits];
    out.append(buf, append(buf, value));
}

template <typename T>
[[nodiscard]]
inline std::string to_string(T value) {
    std::string out;
    append(out, value);
    return out;
}

// Strict decimal parser: digits only, no sign, no whitespace, no overflow.
// Returns false (and leaves out untouched) on any violation.
template <typename T>
[[nodiscard]]
inline bool parse_unsigned(std::string_view text, T& out) noexcept {
    static_assert(is_unsigned_value_v<T>, "lcr::json::parse_unsigned requires an unsigned integer");

    if (text.empty() || text.size() > max_unsigned_digits) {
        return false;
    }
    const T max = static_cast<T>(~T{0});
    T value{0};
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        const T digit = static_cast<T>(c - '0');
        // value * 10 + digit must stay <= max
        if (value > static_cast<T>((max - digit) / 10)) {
            return false;
        }
        value = static_cast<T>(value * 10 + digit);
    }
    out = value;
    return true;
}

} // namespace json
} // namespace lcr
