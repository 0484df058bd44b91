#pragma once

/// @file src/core/checked_math.hpp
/// @brief Overflow-checked 128-bit arithmetic and ratio narrowing.
///
/// Financial accumulators must never wrap. Every add/sub/mul on `Amount`
/// goes through these helpers, which throw
/// `ReportingError{ArithmeticOverflow}` instead of wrapping.
///
/// Narrowing of ratios to the 32-bit report fields is saturating: negative
/// values become 0 for unsigned fields, out-of-range values clamp to the
/// field's bounds.

#include "finrep/error.hpp"
#include "finrep/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace finrep::core {

/// Largest representable `Amount` (2^127 − 1).
inline constexpr Amount AMOUNT_MAX =
    static_cast<Amount>((static_cast<unsigned __int128>(1) << 127) - 1);

/// Smallest representable `Amount` (−2^127).
inline constexpr Amount AMOUNT_MIN = -AMOUNT_MAX - 1;

[[noreturn]] inline void throw_overflow(std::string_view op, std::string_view what) {
    throw ReportingError(ErrorKind::ArithmeticOverflow,
                         std::string(what) + ": 128-bit " + std::string(op) + " overflow");
}

[[nodiscard]] inline Amount checked_add(Amount a, Amount b, std::string_view what) {
    Amount out = 0;
    if (__builtin_add_overflow(a, b, &out)) {
        throw_overflow("add", what);
    }
    return out;
}

[[nodiscard]] inline Amount checked_sub(Amount a, Amount b, std::string_view what) {
    Amount out = 0;
    if (__builtin_sub_overflow(a, b, &out)) {
        throw_overflow("sub", what);
    }
    return out;
}

[[nodiscard]] inline Amount checked_mul(Amount a, Amount b, std::string_view what) {
    Amount out = 0;
    if (__builtin_mul_overflow(a, b, &out)) {
        throw_overflow("mul", what);
    }
    return out;
}

/// `numerator * 100 / denominator`, truncated toward zero.
/// Precondition: `denominator != 0`.
[[nodiscard]] inline Amount scaled_percent(Amount numerator, Amount denominator,
                                           std::string_view what) {
    return checked_mul(numerator, 100, what) / denominator;
}

[[nodiscard]] constexpr std::uint32_t saturate_u32(Amount value) noexcept {
    if (value <= 0) return 0;
    if (value > static_cast<Amount>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<std::uint32_t>(value);
}

[[nodiscard]] constexpr std::int32_t saturate_i32(Amount value) noexcept {
    if (value < static_cast<Amount>(INT32_MIN)) return INT32_MIN;
    if (value > static_cast<Amount>(INT32_MAX)) return INT32_MAX;
    return static_cast<std::int32_t>(value);
}

/// Clamp into [0, 100].
[[nodiscard]] constexpr std::uint32_t clamp_percent(Amount value) noexcept {
    if (value <= 0) return 0;
    if (value >= 100) return 100;
    return static_cast<std::uint32_t>(value);
}

} // namespace finrep::core
