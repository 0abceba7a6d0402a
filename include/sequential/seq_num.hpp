#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

/*
================================================================================
Sequence Number Capability
================================================================================

A single numeric abstraction shared by every supported width:

  • zero() / one()        -> construction defaults
  • max_val()             -> largest representable value
  • checked_add(a, b, r)  -> r = a + b, or false if the sum exceeds max_val()

checked_add never wraps and never writes the output on overflow.

Supported types:
  • std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t
  • std::size_t (native width; usually an alias of one of the above)
  • unsigned __int128 where the compiler provides it (sequential::u128)

Signed integers, bool, character types and floating point are rejected.
================================================================================
*/

namespace sequential {

#ifdef __SIZEOF_INT128__
#define SEQUENTIAL_HAS_INT128 1
using u128 = unsigned __int128;
#endif

namespace detail {

template <typename T>
inline constexpr bool is_character_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

// Builtin unsigned integers (excluding bool and character types)
template <typename T>
concept builtin_unsigned = std::unsigned_integral<T> && !std::same_as<T, bool> && !is_character_v<T>;

} // namespace detail


template <typename T>
struct seq_num_traits; // undefined for unsupported types

template <detail::builtin_unsigned T>
struct seq_num_traits<T> {
    [[nodiscard]] static constexpr T zero() noexcept { return T{0}; }
    [[nodiscard]] static constexpr T one() noexcept { return T{1}; }
    [[nodiscard]] static constexpr T max_val() noexcept { return std::numeric_limits<T>::max(); }

    [[nodiscard]]
    static constexpr bool checked_add(T a, T b, T& out) noexcept {
        if (b > static_cast<T>(max_val() - a)) {
            return false;
        }
        out = static_cast<T>(a + b);
        return true;
    }
};

#ifdef SEQUENTIAL_HAS_INT128
// numeric_limits<unsigned __int128> is not specialised in strict ISO mode
template <>
struct seq_num_traits<u128> {
    [[nodiscard]] static constexpr u128 zero() noexcept { return 0; }
    [[nodiscard]] static constexpr u128 one() noexcept { return 1; }
    [[nodiscard]] static constexpr u128 max_val() noexcept { return ~u128{0}; }

    [[nodiscard]]
    static constexpr bool checked_add(u128 a, u128 b, u128& out) noexcept {
        if (b > max_val() - a) {
            return false;
        }
        out = a + b;
        return true;
    }
};
#endif


// Any type with a complete seq_num_traits specialisation
template <typename T>
concept SeqNum =
    std::totally_ordered<T> && std::copyable<T> &&
    requires(T a, T b, T& out) {
        { seq_num_traits<T>::zero() } noexcept -> std::same_as<T>;
        { seq_num_traits<T>::one() } noexcept -> std::same_as<T>;
        { seq_num_traits<T>::max_val() } noexcept -> std::same_as<T>;
        { seq_num_traits<T>::checked_add(a, b, out) } noexcept -> std::same_as<bool>;
    };


static_assert(SeqNum<std::uint8_t>);
static_assert(SeqNum<std::uint16_t>);
static_assert(SeqNum<std::uint32_t>);
static_assert(SeqNum<std::uint64_t>);
static_assert(SeqNum<std::size_t>);
#ifdef SEQUENTIAL_HAS_INT128
static_assert(SeqNum<u128>);
#endif
static_assert(!SeqNum<int>);
static_assert(!SeqNum<bool>);
static_assert(!SeqNum<double>);

} // namespace sequential
