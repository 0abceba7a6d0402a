#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <ranges>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "sequential/seq_num.hpp"
#include "sequential/error.hpp"
#include "sequential/state.hpp"
#include "lcr/optional.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

/*
================================================================================
Sequence<T>: monotonic sequence number generator
================================================================================

Produces start, start + step, start + 2*step, ... on demand.

Lifecycle:
  • producing  -> exhausted : the next addition would overflow T, or the
                              current value has passed the configured limit
  • exhausted  -> producing : only through reset()

Exhaustion is detected one step ahead: the last representable value is still
returned, and only the following call yields nothing.

A zero step is accepted and yields a constant sequence that never exhausts.

Nothing ever decreases the current value except reset(). fast_forward() and
continue_after() only move it forward.

Single-threaded value type. Callers sharing one instance across threads must
provide their own synchronisation.
================================================================================
*/

namespace sequential {

template <SeqNum T>
class Sequence {
    using traits = seq_num_traits<T>;

public:
    using value_type = T;
    using state_type = State<T>;

    // ---------------------------------------------------------
    // Input iterator driving next()
    // ---------------------------------------------------------
    // A default-constructed iterator is the past-the-end position, so
    // begin()/end() form a common range usable by <numeric> algorithms.
    class iterator {
    public:
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;
        using iterator_category = std::input_iterator_tag;
        using iterator_concept  = std::input_iterator_tag;

        iterator() = default;
        explicit iterator(Sequence* seq) : seq_(seq) { advance_(); }

        [[nodiscard]] const T& operator*() const noexcept { return value_.value(); }

        iterator& operator++() noexcept {
            advance_();
            return *this;
        }
        iterator operator++(int) noexcept {
            iterator prev(*this);
            advance_();
            return prev;
        }

        [[nodiscard]] friend bool operator==(const iterator& a, const iterator& b) noexcept {
            if (!a.value_.has() || !b.value_.has()) {
                return a.value_.has() == b.value_.has();
            }
            return a.seq_ == b.seq_ && a.value_.value() == b.value_.value();
        }

        [[nodiscard]] friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return !it.value_.has();
        }

    private:
        void advance_() noexcept {
            value_ = seq_->next();
        }

        Sequence* seq_ = nullptr;
        lcr::optional<T> value_{};
    };

public:
    // start 0, step 1
    constexpr Sequence() noexcept
        : Sequence(traits::zero(), traits::one()) {}

    constexpr Sequence(T start, T step) noexcept
        : start_(start)
        , current_(start)
        , step_(step)
        , limit_(traits::max_val())
        , exhausted_(false) {}

    [[nodiscard]]
    static constexpr Sequence start_with(T start) noexcept {
        return Sequence(start, traits::one());
    }

    [[nodiscard]]
    static constexpr Sequence with_step(T step) noexcept {
        return Sequence(traits::zero(), step);
    }

    // Values above limit are never produced.
    // A start above limit gives a sequence that is exhausted on first use.
    [[nodiscard]]
    static constexpr Sequence bounded(T start, T limit, T step) noexcept {
        Sequence seq(start, step);
        seq.limit_ = limit;
        return seq;
    }

    // Starts with val + 1. If val is the maximum of T, the sequence never
    // produces anything, not even after reset().
    [[nodiscard]]
    static constexpr Sequence start_after(T val) noexcept {
        T start{};
        if (traits::checked_add(val, traits::one(), start)) {
            return start_with(start);
        }
        return dead_();
    }

    // Starts after the highest value found in values (after zero if empty).
    // Elements must already be of type T: a narrowing conversion could hide
    // the real highest value.
    template <std::ranges::input_range R>
        requires std::same_as<std::remove_cvref_t<std::ranges::range_reference_t<R>>, T>
    [[nodiscard]]
    static Sequence start_after_highest(R&& values) {
        T highest = traits::zero();
        for (const T& v : values) {
            if (v > highest) {
                highest = v;
            }
        }
        return start_after(highest);
    }

    [[nodiscard]]
    static constexpr Sequence from_state(const state_type& st) noexcept {
        Sequence seq(st.start, st.step);
        seq.current_   = st.current;
        seq.limit_     = st.limit;
        seq.exhausted_ = st.exhausted;
        return seq;
    }

    // Same sequence with a different step. The new step applies from the
    // next advance on. An exhausted sequence keeps its step.
    [[nodiscard]]
    constexpr Sequence with_increment(T step) const& noexcept {
        Sequence seq(*this);
        seq.set_step_(step);
        return seq;
    }

    [[nodiscard]]
    constexpr Sequence with_increment(T step) && noexcept {
        set_step_(step);
        return std::move(*this);
    }

    // ---------------------------------------------------------
    // Production
    // ---------------------------------------------------------

    // Returns the current value and advances by step, or nothing once exhausted.
    [[nodiscard]]
    lcr::optional<T> next() noexcept {
        if (exhausted_) {
            return {};
        }
        if (current_ > limit_) {
            latch_exhausted_("limit passed");
            return {};
        }
        const T result = current_;
        T candidate{};
        if (traits::checked_add(current_, step_, candidate)) {
            current_ = candidate;
        }
        else {
            latch_exhausted_("next value exceeds type maximum");
        }
        return result;
    }

    // What the next successful production would return.
    // Does not consult the exhaustion flag.
    [[nodiscard]]
    constexpr T peek() const noexcept {
        return current_;
    }

    // Moves current forward by skip_by. On overflow nothing changes.
    // Exhaustion is left to next(): landing exactly on the maximum is valid.
    [[nodiscard]]
    sequence::Error fast_forward(T skip_by) noexcept {
        T candidate{};
        if (!traits::checked_add(current_, skip_by, candidate)) {
            SEQ_DEBUG("[SEQUENCE] fast_forward(" << lcr::json::to_string(skip_by) << ") from "
                      << lcr::json::to_string(current_) << " overflows -> rejected");
            return sequence::Error::Overflow;
        }
        current_ = candidate;
        return sequence::Error::None;
    }

    // Guarantees val is never produced from now on.
    // current becomes max(current, val + step), using 1 when step is zero.
    void continue_after(T val) noexcept {
        const T incr = (step_ == traits::zero()) ? traits::one() : step_;
        T candidate{};
        if (!traits::checked_add(val, incr, candidate)) {
            latch_exhausted_("continue_after beyond type maximum");
            return;
        }
        if (candidate > current_) {
            current_ = candidate;
        }
    }

    constexpr void reset() noexcept {
        current_   = start_;
        exhausted_ = false;
    }

    // ---------------------------------------------------------
    // Accessors
    // ---------------------------------------------------------
    [[nodiscard]] constexpr bool is_exhausted() const noexcept { return exhausted_; }
    [[nodiscard]] constexpr T start() const noexcept { return start_; }
    [[nodiscard]] constexpr T step() const noexcept { return step_; }
    [[nodiscard]] constexpr T limit() const noexcept { return limit_; }

    [[nodiscard]]
    constexpr state_type state() const noexcept {
        return state_type{start_, current_, step_, limit_, exhausted_};
    }

    // ---------------------------------------------------------
    // Iteration (consumes values)
    // ---------------------------------------------------------
    [[nodiscard]] iterator begin() noexcept { return iterator{this}; }
    [[nodiscard]] iterator end() const noexcept { return iterator{}; }

    // ---------------------------------------------------------
    // Debug / diagnostic dump
    // ---------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "Sequence{start=" << lcr::json::to_string(start_)
           << ", current=" << lcr::json::to_string(current_)
           << ", step=" << lcr::json::to_string(step_);
        if (limit_ != traits::max_val()) {
            os << ", limit=" << lcr::json::to_string(limit_);
        }
        os << ", exhausted=" << (exhausted_ ? "true" : "false") << "}";
    }

    [[nodiscard]]
    inline std::string str() const {
        std::ostringstream oss;
        dump(oss);
        return oss.str();
    }

private:
    [[nodiscard]]
    static constexpr Sequence dead_() noexcept {
        return bounded(traits::max_val(), static_cast<T>(traits::max_val() - traits::one()), traits::one());
    }

    constexpr void set_step_(T step) noexcept {
        if (!exhausted_) {
            step_ = step;
        }
    }

    void latch_exhausted_(const char* reason) noexcept {
        exhausted_ = true;
        SEQ_DEBUG("[SEQUENCE] exhausted at " << lcr::json::to_string(current_) << " (" << reason << ")");
    }

private:
    T start_;
    T current_;
    T step_;
    T limit_;
    bool exhausted_;
};


// Stream operator
template <SeqNum T>
inline std::ostream& operator<<(std::ostream& os, const Sequence<T>& seq) {
    seq.dump(os);
    return os;
}

template <SeqNum T>
[[nodiscard]]
inline std::string to_string(const Sequence<T>& seq) {
    return seq.str();
}

static_assert(Persistable<Sequence<std::uint64_t>>);
static_assert(std::input_iterator<Sequence<std::uint8_t>::iterator>);
static_assert(std::sentinel_for<std::default_sentinel_t, Sequence<std::uint8_t>::iterator>);
static_assert(std::ranges::common_range<Sequence<std::uint8_t>&>);

} // namespace sequential
