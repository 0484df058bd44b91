#pragma once

/// @file include/finrep/in_memory.hpp
/// @brief In-memory collaborators backing the CLI and the test suites.
///
/// These are reference stand-ins for the upstream services: they hold
/// already-materialized records and answer queries from them. They carry no
/// business logic beyond owner/active/paid filtering.

#include "finrep/collaborators.hpp"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace finrep {

/// Fixed percentage split. `calculate_split` truncates each share and gives
/// the rounding remainder to the last category so the shares sum to the total.
class InMemoryRemittanceSplit final : public RemittanceSplitService {
public:
    explicit InMemoryRemittanceSplit(std::vector<std::uint32_t> percentages = {})
        : percentages_(std::move(percentages)) {}

    [[nodiscard]] std::vector<std::uint32_t> get_split() const override;
    [[nodiscard]] std::vector<Amount> calculate_split(Amount total_amount) const override;

private:
    std::vector<std::uint32_t> percentages_;
};

class InMemorySavingsGoals final : public SavingsGoalService {
public:
    explicit InMemorySavingsGoals(std::vector<SavingsGoal> goals = {})
        : goals_(std::move(goals)) {}

    void add(SavingsGoal goal) { goals_.push_back(std::move(goal)); }

    [[nodiscard]] std::vector<SavingsGoal> get_all_goals(const Identity& owner) const override;
    [[nodiscard]] bool is_goal_completed(std::uint32_t goal_id) const override;

private:
    std::vector<SavingsGoal> goals_;
};

class InMemoryBillPayments final : public BillPaymentService {
public:
    explicit InMemoryBillPayments(std::vector<Bill> bills = {})
        : bills_(std::move(bills)) {}

    void add(Bill bill) { bills_.push_back(std::move(bill)); }

    [[nodiscard]] std::vector<Bill> get_unpaid_bills(const Identity& owner) const override;
    [[nodiscard]] Amount get_total_unpaid(const Identity& owner) const override;
    [[nodiscard]] std::vector<Bill> get_all_bills() const override;

private:
    std::vector<Bill> bills_;
};

/// Holds every policy; queries return only the owner's active ones.
class InMemoryInsurance final : public InsuranceService {
public:
    explicit InMemoryInsurance(std::vector<InsurancePolicy> policies = {})
        : policies_(std::move(policies)) {}

    void add(InsurancePolicy policy) { policies_.push_back(std::move(policy)); }

    [[nodiscard]] std::vector<InsurancePolicy>
    get_active_policies(const Identity& owner) const override;

    [[nodiscard]] Amount get_total_monthly_premium(const Identity& owner) const override;

private:
    std::vector<InsurancePolicy> policies_;
};

/// Address book of non-owned service pointers.
class StaticDirectory final : public CollaboratorDirectory {
public:
    void bind(const Identity& address, const RemittanceSplitService& service);
    void bind(const Identity& address, const SavingsGoalService& service);
    void bind(const Identity& address, const BillPaymentService& service);
    void bind(const Identity& address, const InsuranceService& service);

    [[nodiscard]] const RemittanceSplitService*
    remittance_split(const Identity& address) const override;
    [[nodiscard]] const SavingsGoalService*
    savings_goals(const Identity& address) const override;
    [[nodiscard]] const BillPaymentService*
    bill_payments(const Identity& address) const override;
    [[nodiscard]] const InsuranceService*
    insurance(const Identity& address) const override;

private:
    std::map<Identity, const RemittanceSplitService*> splits_;
    std::map<Identity, const SavingsGoalService*>     goals_;
    std::map<Identity, const BillPaymentService*>     bills_;
    std::map<Identity, const InsuranceService*>       insurance_;
};

class FixedClock final : public LedgerClock {
public:
    explicit FixedClock(Timestamp now = 0) noexcept : now_(now) {}

    [[nodiscard]] Timestamp now() const override { return now_; }
    void set(Timestamp now) noexcept { now_ = now; }

private:
    Timestamp now_;
};

/// Authorizes exactly the identities it was given.
class AllowListAuthorizer final : public Authorizer {
public:
    AllowListAuthorizer() = default;
    AllowListAuthorizer(std::initializer_list<Identity> allowed)
        : allowed_(allowed) {}

    void allow(const Identity& identity) { allowed_.insert(identity); }
    void revoke(const Identity& identity) { allowed_.erase(identity); }

    [[nodiscard]] bool is_authorized(const Identity& identity) const override {
        return allowed_.contains(identity);
    }

private:
    std::set<Identity> allowed_;
};

} // namespace finrep
