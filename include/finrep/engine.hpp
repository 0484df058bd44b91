#pragma once

/// @file include/finrep/engine.hpp
/// @brief Reporting Engine, public API of the financial health service.
///
/// # Module: Reporting Engine
///
/// ## Responsibility
/// Resolve collaborators from the configured addresses, run the calculators
/// and the health score engine, assemble composite reports, and manage the
/// persistent records (admin, addresses, stored reports).
///
/// ## Usage
/// ```cpp
/// finrep::ReportingState  state;
/// finrep::InMemoryReportStore store;
/// finrep::EventLog        events;
/// finrep::core::ReportingEngine engine(
///     finrep::core::ReportingContext{state, store, directory, clock, auth, events});
/// engine.init(admin);
/// engine.configure_addresses(admin, addresses);
/// auto report = engine.get_financial_health_report(user, 10'000, start, end);
/// fmt::print("{}\n", report.to_string());
/// ```
///
/// ## Guarantees
/// - Every operation is all-or-nothing: state writes and events are staged
///   and applied only after the operation succeeded. A thrown
///   `ReportingError` leaves state, store and event sink untouched.
/// - No shared mutable state besides the injected context; the engine takes
///   no locks and expects callers to serialize requests.
/// - No retries, no timeouts: a failing collaborator call is fatal.

#include "finrep/collaborators.hpp"
#include "finrep/config.hpp"
#include "finrep/events.hpp"
#include "finrep/report_store.hpp"
#include "finrep/reports.hpp"

#include <optional>

namespace finrep::core {

/// Everything the engine reads or writes outside of its own stack frame.
/// All references must outlive the engine.
struct ReportingContext {
    ReportingState&              state;
    ReportStore&                 store;
    const CollaboratorDirectory& directory;
    const LedgerClock&           clock;
    const Authorizer&            authorizer;
    EventSink&                   events;
};

class ReportingEngine {
public:
    explicit ReportingEngine(ReportingContext context,
                             EngineConfig config = EngineConfig{}) noexcept;

    // ── Administration ────────────────────────────────────────────────────────

    /// Record `admin` as the administrator. Requires authorization of
    /// `admin`; fails with `AlreadyInitialized` on a second call.
    void init(const Identity& admin);

    /// Replace the collaborator addresses. Requires authorization of
    /// `caller` and `caller == admin`. Publishes `AddressesConfigured`.
    void configure_addresses(const Identity& caller,
                             const CollaboratorAddresses& addresses);

    [[nodiscard]] std::optional<CollaboratorAddresses> get_addresses() const;
    [[nodiscard]] std::optional<Identity> get_admin() const;

    // ── Reports ───────────────────────────────────────────────────────────────

    /// `user` is accepted for symmetry with the other reports and not used:
    /// the split is global to the remittance collaborator.
    [[nodiscard]] RemittanceSummary get_remittance_summary(const Identity& user,
                                                           Amount total_amount,
                                                           Timestamp period_start,
                                                           Timestamp period_end) const;

    [[nodiscard]] SavingsReport get_savings_report(const Identity& user,
                                                   Timestamp period_start,
                                                   Timestamp period_end) const;

    [[nodiscard]] BillComplianceReport get_bill_compliance_report(const Identity& user,
                                                                  Timestamp period_start,
                                                                  Timestamp period_end) const;

    [[nodiscard]] InsuranceReport get_insurance_report(const Identity& user,
                                                       Timestamp period_start,
                                                       Timestamp period_end) const;

    /// `total_remittance` does not influence the score.
    [[nodiscard]] HealthScore calculate_health_score(const Identity& user,
                                                     Amount total_remittance) const;

    /// Run the health score engine and all four calculators, stamp the
    /// result with the ledger time, and publish `ReportGenerated`.
    [[nodiscard]] FinancialHealthReport
    get_financial_health_report(const Identity& user,
                                Amount total_remittance,
                                Timestamp period_start,
                                Timestamp period_end);

    /// Pure; needs neither configuration nor collaborators.
    [[nodiscard]] TrendData get_trend_analysis(const Identity& user,
                                               Amount current_amount,
                                               Amount previous_amount) const;

    // ── Storage ───────────────────────────────────────────────────────────────

    /// Upsert `report` under (user, period_key). Requires authorization of
    /// `user`. Publishes `ReportStored`.
    void store_report(const Identity& user,
                      const FinancialHealthReport& report,
                      PeriodKey period_key);

    [[nodiscard]] std::optional<FinancialHealthReport>
    get_stored_report(const Identity& user, PeriodKey period_key) const;

private:
    /// Addresses or `AddressesNotConfigured`.
    [[nodiscard]] const CollaboratorAddresses& addresses() const;

    void require_auth(const Identity& identity) const;

    [[nodiscard]] const RemittanceSplitService& remittance_split() const;
    [[nodiscard]] const SavingsGoalService&     savings_goals() const;
    [[nodiscard]] const BillPaymentService&     bill_payments() const;
    [[nodiscard]] const InsuranceService&       insurance() const;

    ReportingContext ctx_;
    EngineConfig     config_;
};

} // namespace finrep::core
