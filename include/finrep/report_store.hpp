#pragma once

/// @file include/finrep/report_store.hpp
/// @brief Keyed persistence of assembled financial health reports.
///
/// Key: (owner, period key). Writes are upserts with last-write-wins
/// semantics: no merge, no versioning. Lookup of an unwritten key yields
/// `std::nullopt`, never a default-constructed report. Authorization is
/// enforced by the engine, not by the store.

#include "finrep/reports.hpp"
#include "finrep/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <utility>

namespace finrep {

class ReportStore {
public:
    virtual ~ReportStore() = default;

    virtual void put(const Identity& owner, PeriodKey period_key,
                     const FinancialHealthReport& report) = 0;

    [[nodiscard]] virtual std::optional<FinancialHealthReport>
    get(const Identity& owner, PeriodKey period_key) const = 0;

    /// Remove the entry under the key, if any. Used to undo a write when a
    /// later step of the same commit fails.
    virtual void erase(const Identity& owner, PeriodKey period_key) = 0;
};

/// Ordered in-memory store.
class InMemoryReportStore final : public ReportStore {
public:
    void put(const Identity& owner, PeriodKey period_key,
             const FinancialHealthReport& report) override;

    [[nodiscard]] std::optional<FinancialHealthReport>
    get(const Identity& owner, PeriodKey period_key) const override;

    void erase(const Identity& owner, PeriodKey period_key) override;

    [[nodiscard]] std::size_t size() const noexcept { return reports_.size(); }

private:
    using Key = std::pair<Identity, PeriodKey>;
    std::map<Key, FinancialHealthReport> reports_;
};

} // namespace finrep
