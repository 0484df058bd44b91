/// @file src/core/in_memory.cpp
/// @brief In-memory collaborators.

#include "finrep/in_memory.hpp"
#include "finrep/constants.hpp"

#include "checked_math.hpp"

#include <algorithm>
#include <iterator>

namespace finrep {

// ─── InMemoryRemittanceSplit ──────────────────────────────────────────────────

std::vector<std::uint32_t> InMemoryRemittanceSplit::get_split() const {
    return percentages_;
}

std::vector<Amount> InMemoryRemittanceSplit::calculate_split(Amount total_amount) const {
    std::vector<Amount> out;
    out.reserve(percentages_.size());

    Amount allocated = 0;
    for (std::size_t i = 0; i < percentages_.size(); ++i) {
        if (i + 1 == percentages_.size()) {
            out.push_back(core::checked_sub(total_amount, allocated, "split remainder"));
            break;
        }
        const Amount share =
            core::checked_mul(total_amount, static_cast<Amount>(percentages_[i]), "split share")
            / constants::PERCENT_SCALE;
        allocated = core::checked_add(allocated, share, "split allocated");
        out.push_back(share);
    }
    return out;
}

// ─── InMemorySavingsGoals ─────────────────────────────────────────────────────

std::vector<SavingsGoal> InMemorySavingsGoals::get_all_goals(const Identity& owner) const {
    std::vector<SavingsGoal> out;
    std::copy_if(goals_.begin(), goals_.end(), std::back_inserter(out),
                 [&](const SavingsGoal& g) { return g.owner == owner; });
    return out;
}

bool InMemorySavingsGoals::is_goal_completed(std::uint32_t goal_id) const {
    const auto it = std::find_if(goals_.begin(), goals_.end(),
                                 [goal_id](const SavingsGoal& g) { return g.id == goal_id; });
    return it != goals_.end() && it->current_amount >= it->target_amount;
}

// ─── InMemoryBillPayments ─────────────────────────────────────────────────────

std::vector<Bill> InMemoryBillPayments::get_unpaid_bills(const Identity& owner) const {
    std::vector<Bill> out;
    std::copy_if(bills_.begin(), bills_.end(), std::back_inserter(out),
                 [&](const Bill& b) { return b.owner == owner && !b.paid; });
    return out;
}

Amount InMemoryBillPayments::get_total_unpaid(const Identity& owner) const {
    Amount total = 0;
    for (const auto& b : bills_) {
        if (b.owner == owner && !b.paid) {
            total = core::checked_add(total, b.amount, "bills total_unpaid");
        }
    }
    return total;
}

std::vector<Bill> InMemoryBillPayments::get_all_bills() const {
    return bills_;
}

// ─── InMemoryInsurance ────────────────────────────────────────────────────────

std::vector<InsurancePolicy>
InMemoryInsurance::get_active_policies(const Identity& owner) const {
    std::vector<InsurancePolicy> out;
    std::copy_if(policies_.begin(), policies_.end(), std::back_inserter(out),
                 [&](const InsurancePolicy& p) { return p.owner == owner && p.active; });
    return out;
}

Amount InMemoryInsurance::get_total_monthly_premium(const Identity& owner) const {
    Amount total = 0;
    for (const auto& p : policies_) {
        if (p.owner == owner && p.active) {
            total = core::checked_add(total, p.monthly_premium, "insurance monthly_premium");
        }
    }
    return total;
}

// ─── StaticDirectory ──────────────────────────────────────────────────────────

namespace {

template <typename Service>
const Service* lookup(const std::map<Identity, const Service*>& table,
                      const Identity& address) {
    const auto it = table.find(address);
    return it == table.end() ? nullptr : it->second;
}

} // anonymous namespace

void StaticDirectory::bind(const Identity& address, const RemittanceSplitService& service) {
    splits_.insert_or_assign(address, &service);
}

void StaticDirectory::bind(const Identity& address, const SavingsGoalService& service) {
    goals_.insert_or_assign(address, &service);
}

void StaticDirectory::bind(const Identity& address, const BillPaymentService& service) {
    bills_.insert_or_assign(address, &service);
}

void StaticDirectory::bind(const Identity& address, const InsuranceService& service) {
    insurance_.insert_or_assign(address, &service);
}

const RemittanceSplitService* StaticDirectory::remittance_split(const Identity& address) const {
    return lookup(splits_, address);
}

const SavingsGoalService* StaticDirectory::savings_goals(const Identity& address) const {
    return lookup(goals_, address);
}

const BillPaymentService* StaticDirectory::bill_payments(const Identity& address) const {
    return lookup(bills_, address);
}

const InsuranceService* StaticDirectory::insurance(const Identity& address) const {
    return lookup(insurance_, address);
}

} // namespace finrep
