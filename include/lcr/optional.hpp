#pragma once

#include <string>
#include <sstream>
#include <type_traits>
#include <utility>
#include <cassert>

#include "lcr/json.hpp"


namespace lcr {

// Minimal value-or-nothing holder.
// T must be default constructible; an empty optional still holds T{}.
template <typename T>
class optional {
public:
    constexpr optional() noexcept(std::is_nothrow_default_constructible_v<T>) : has_(false), value_{} {}
    constexpr optional(const T& v) : has_(true), value_(v) {}
    constexpr optional(T&& v) : has_(true), value_(std::move(v)) {}

    [[nodiscard]] constexpr bool has() const noexcept { return has_; }
    constexpr explicit operator bool() const noexcept { return has_; }

    [[nodiscard]] constexpr const T& value() const {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }
    [[nodiscard]] constexpr T& value() {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }
    [[nodiscard]] constexpr T value_or(T fallback) const {
        return has_ ? value_ : fallback;
    }

    constexpr void reset() {
        has_ = false;
        value_ = T{};
    }

    constexpr optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

    constexpr optional& operator=(T&& v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

    // Two optionals are equal when both are empty or both hold equal values
    [[nodiscard]] friend constexpr bool operator==(const optional& a, const optional& b) {
        if (a.has_ != b.has_) return false;
        return !a.has_ || a.value_ == b.value_;
    }

    [[nodiscard]] friend constexpr bool operator==(const optional& a, const T& v) {
        return a.has_ && a.value_ == v;
    }

private:
    bool has_;
    T value_;
};


template <typename T>
inline std::string to_string(const optional<T>& opt) {
    if (!opt.has()) {
        return "null";
    }
    // Unsigned integers (128-bit included) -> decimal
    if constexpr (json::is_unsigned_value_v<T>) {
        return json::to_string(opt.value());
    }
    else if constexpr (std::is_arithmetic_v<T>) {
        return std::to_string(opt.value());
    }
    // If T is std::string or string_view
    else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
        return "\"" + std::string(opt.value()) + "\"";
    }
    // Fallback: stream to string
    else {
        std::ostringstream oss;
        oss << opt.value();
        return oss.str();
    }
}

} // namespace lcr
