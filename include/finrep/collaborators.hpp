#pragma once

/// @file include/finrep/collaborators.hpp
/// @brief Interfaces of the external services the engine consumes.
///
/// # Module: Collaborators
///
/// ## Responsibility
/// Describe, and only describe, what the engine reads from the outside
/// world: the four upstream domain services, the ledger clock, the
/// authorization check, and the directory that maps configured addresses to
/// live services.
///
/// ## Contract
/// - Calls are synchronous. A failing call throws; the engine converts any
///   `std::exception` into `ReportingError{CollaboratorFailure}` and aborts.
/// - Returned data is trusted as-is. The engine never cross-validates two
///   calls against each other.
///
/// ## NOT Responsible For
/// - How upstream services compute their figures
/// - Signature verification mechanics behind `Authorizer`

#include "finrep/types.hpp"

#include <cstdint>
#include <vector>

namespace finrep {

/// Remittance split calculator.
class RemittanceSplitService {
public:
    virtual ~RemittanceSplitService() = default;

    /// Percentage per category, indexed in `constants::CATEGORY_ORDER`.
    [[nodiscard]] virtual std::vector<std::uint32_t> get_split() const = 0;

    /// Split of `total_amount` per category, same indexing as `get_split`.
    [[nodiscard]] virtual std::vector<Amount>
    calculate_split(Amount total_amount) const = 0;
};

/// Savings-goal tracker.
class SavingsGoalService {
public:
    virtual ~SavingsGoalService() = default;

    [[nodiscard]] virtual std::vector<SavingsGoal>
    get_all_goals(const Identity& owner) const = 0;

    [[nodiscard]] virtual bool is_goal_completed(std::uint32_t goal_id) const = 0;
};

/// Bill-payment tracker.
class BillPaymentService {
public:
    virtual ~BillPaymentService() = default;

    [[nodiscard]] virtual std::vector<Bill>
    get_unpaid_bills(const Identity& owner) const = 0;

    [[nodiscard]] virtual Amount get_total_unpaid(const Identity& owner) const = 0;

    /// Every bill in the system, all owners.
    [[nodiscard]] virtual std::vector<Bill> get_all_bills() const = 0;
};

/// Insurance-policy tracker.
class InsuranceService {
public:
    virtual ~InsuranceService() = default;

    [[nodiscard]] virtual std::vector<InsurancePolicy>
    get_active_policies(const Identity& owner) const = 0;

    [[nodiscard]] virtual Amount
    get_total_monthly_premium(const Identity& owner) const = 0;
};

/// Resolves a configured service address to a live client.
///
/// Returns nullptr when nothing answers at `address`; the engine reports that
/// as an unreachable collaborator. Returned pointers are non-owning and must
/// stay valid for the duration of the engine call.
class CollaboratorDirectory {
public:
    virtual ~CollaboratorDirectory() = default;

    [[nodiscard]] virtual const RemittanceSplitService*
    remittance_split(const Identity& address) const = 0;

    [[nodiscard]] virtual const SavingsGoalService*
    savings_goals(const Identity& address) const = 0;

    [[nodiscard]] virtual const BillPaymentService*
    bill_payments(const Identity& address) const = 0;

    [[nodiscard]] virtual const InsuranceService*
    insurance(const Identity& address) const = 0;
};

/// Source of the current ledger time.
class LedgerClock {
public:
    virtual ~LedgerClock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

/// Proof that a request was made by `identity`.
class Authorizer {
public:
    virtual ~Authorizer() = default;
    [[nodiscard]] virtual bool is_authorized(const Identity& identity) const = 0;
};

} // namespace finrep
