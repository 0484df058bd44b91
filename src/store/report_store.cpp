/// @file src/store/report_store.cpp
/// @brief In-memory report store.

#include "finrep/report_store.hpp"

namespace finrep {

void InMemoryReportStore::put(const Identity& owner, PeriodKey period_key,
                              const FinancialHealthReport& report) {
    // Last write wins; the previous entry is replaced whole.
    reports_.insert_or_assign(Key{owner, period_key}, report);
}

std::optional<FinancialHealthReport>
InMemoryReportStore::get(const Identity& owner, PeriodKey period_key) const {
    const auto it = reports_.find(Key{owner, period_key});
    if (it == reports_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryReportStore::erase(const Identity& owner, PeriodKey period_key) {
    reports_.erase(Key{owner, period_key});
}

} // namespace finrep
