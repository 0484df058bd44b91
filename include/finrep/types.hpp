#pragma once

/// @file include/finrep/types.hpp
/// @brief Shared primitive types for the financial health reporting engine.
///
/// Every module includes this file. It defines the scalar aliases, the
/// identity strong type, the fixed category enumeration, and the raw records
/// owned by the upstream domain services (read-only to the engine).

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace finrep {

// ─── Scalars ──────────────────────────────────────────────────────────────────

/// Signed 128-bit monetary amount in the smallest currency unit.
using Amount = __int128;

/// Ledger timestamp, seconds since epoch.
using Timestamp = std::uint64_t;

/// Opaque identifier of a reporting interval, part of the storage key.
using PeriodKey = std::uint64_t;

// ─── Identity ─────────────────────────────────────────────────────────────────

/// An account or service address. Compared by value.
struct Identity {
    std::string value;

    friend bool operator==(const Identity&, const Identity&) = default;
    friend auto operator<=>(const Identity&, const Identity&) = default;
};

// ─── Category ─────────────────────────────────────────────────────────────────

/// Remittance allocation category. Discriminants are part of the stored
/// record layout and must not be renumbered.
enum class Category : std::uint32_t {
    Spending  = 1,
    Savings   = 2,
    Bills     = 3,
    Insurance = 4,
};

/// Human-readable category name.
[[nodiscard]] std::string_view to_string(Category category) noexcept;

// ─── Upstream records ─────────────────────────────────────────────────────────

/// A savings goal as reported by the savings-goal tracker.
struct SavingsGoal {
    std::uint32_t id = 0;
    Identity      owner;
    std::string   name;
    Amount        target_amount  = 0;
    Amount        current_amount = 0;
    Timestamp     target_date    = 0;
    bool          locked         = false;
};

/// A bill as reported by the bill-payment tracker.
struct Bill {
    std::uint32_t            id = 0;
    Identity                 owner;
    std::string              name;
    Amount                   amount         = 0;
    Timestamp                due_date       = 0;
    bool                     recurring      = false;
    std::uint32_t            frequency_days = 0;
    bool                     paid           = false;
    Timestamp                created_at     = 0;
    std::optional<Timestamp> paid_at;
};

/// An insurance policy as reported by the insurance-policy tracker.
struct InsurancePolicy {
    std::uint32_t id = 0;
    Identity      owner;
    std::string   name;
    std::string   coverage_type;
    Amount        monthly_premium   = 0;
    Amount        coverage_amount   = 0;
    bool          active            = false;
    Timestamp     next_payment_date = 0;
};

} // namespace finrep
