#pragma once

/// @file include/finrep/data_loader.hpp
/// @brief CSV fixture loader for upstream records.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files holding savings goals, bills, insurance policies and the
/// remittance split into the record types the in-memory collaborators serve.
/// Malformed rows are skipped with a warning; the loader never throws.
///
/// ## Expected CSV Formats (header line required, skipped)
/// ```
/// goals.csv     id,owner,name,target_amount,current_amount,target_date,locked
/// bills.csv     id,owner,name,amount,due_date,recurring,frequency_days,paid,created_at,paid_at
/// policies.csv  id,owner,name,coverage_type,monthly_premium,coverage_amount,active,next_payment_date
/// split.csv     percentage
/// ```
/// Booleans are `0`/`1` or `true`/`false`. An empty `paid_at` means unpaid.
/// Amounts are signed decimal integers up to 128 bits.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Lines beginning with `#` and blank lines are ignored

#include "finrep/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finrep::core {

class DataLoader {
public:
    DataLoader() = delete;

    [[nodiscard]] static std::vector<SavingsGoal>
    parse_goals_csv(const std::string& csv_content) noexcept;

    [[nodiscard]] static std::vector<Bill>
    parse_bills_csv(const std::string& csv_content) noexcept;

    [[nodiscard]] static std::vector<InsurancePolicy>
    parse_policies_csv(const std::string& csv_content) noexcept;

    [[nodiscard]] static std::vector<std::uint32_t>
    parse_split_csv(const std::string& csv_content) noexcept;

    /// Read a whole file. `nullopt` if it cannot be opened.
    [[nodiscard]] static std::optional<std::string>
    read_file(const std::string& filepath) noexcept;

    /// Parse a signed decimal 128-bit amount. Rejects empty input,
    /// stray characters and values outside the 128-bit range.
    [[nodiscard]] static std::optional<Amount>
    parse_amount(std::string_view token) noexcept;

    /// Split a CSV line on commas and trim each field.
    [[nodiscard]] static std::vector<std::string>
    split_fields(const std::string& line);
};

} // namespace finrep::core
