/// @file src/core/engine.cpp
/// @brief Reporting Engine.

#include "finrep/engine.hpp"
#include "finrep/bills.hpp"
#include "finrep/constants.hpp"
#include "finrep/error.hpp"
#include "finrep/health_score.hpp"
#include "finrep/insurance.hpp"
#include "finrep/remittance.hpp"
#include "finrep/savings.hpp"
#include "finrep/trend.hpp"

#include "collaborator_call.hpp"
#include "unit_of_work.hpp"

#include <fmt/core.h>

#include <string>

namespace finrep::core {

namespace {

/// Turn a directory lookup into a reference or an unreachable-address error.
template <typename Service>
const Service& resolved(const Service* service, std::string_view role,
                        const Identity& address) {
    if (service == nullptr) {
        throw ReportingError(ErrorKind::CollaboratorFailure,
                             fmt::format("{} unreachable at address '{}'", role, address.value));
    }
    return *service;
}

EventRecord make_event(ReportEvent kind,
                       std::optional<Identity> subject,
                       std::optional<std::uint64_t> value) {
    return EventRecord{
        .topic   = constants::EVENT_TOPIC,
        .kind    = kind,
        .subject = std::move(subject),
        .value   = value,
    };
}

} // anonymous namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

ReportingEngine::ReportingEngine(ReportingContext context, EngineConfig config) noexcept
    : ctx_(context)
    , config_(config)
{}

// ─── Internal helpers ─────────────────────────────────────────────────────────

const CollaboratorAddresses& ReportingEngine::addresses() const {
    if (!ctx_.state.addresses) {
        throw ReportingError(ErrorKind::AddressesNotConfigured,
                             "collaborator addresses not configured");
    }
    return *ctx_.state.addresses;
}

void ReportingEngine::require_auth(const Identity& identity) const {
    const bool ok = collaborator_call(
        "authorizer.is_authorized",
        [&] { return ctx_.authorizer.is_authorized(identity); });
    if (!ok) {
        throw ReportingError(ErrorKind::Unauthorized,
                             fmt::format("authorization missing for '{}'", identity.value));
    }
}

const RemittanceSplitService& ReportingEngine::remittance_split() const {
    const Identity& address = addresses().remittance_split;
    return resolved(collaborator_call("directory.remittance_split",
                                      [&] { return ctx_.directory.remittance_split(address); }),
                    "remittance split service", address);
}

const SavingsGoalService& ReportingEngine::savings_goals() const {
    const Identity& address = addresses().savings_goals;
    return resolved(collaborator_call("directory.savings_goals",
                                      [&] { return ctx_.directory.savings_goals(address); }),
                    "savings goal service", address);
}

const BillPaymentService& ReportingEngine::bill_payments() const {
    const Identity& address = addresses().bill_payments;
    return resolved(collaborator_call("directory.bill_payments",
                                      [&] { return ctx_.directory.bill_payments(address); }),
                    "bill payment service", address);
}

const InsuranceService& ReportingEngine::insurance() const {
    const Identity& address = addresses().insurance;
    return resolved(collaborator_call("directory.insurance",
                                      [&] { return ctx_.directory.insurance(address); }),
                    "insurance service", address);
}

// ─── Administration ───────────────────────────────────────────────────────────

void ReportingEngine::init(const Identity& admin) {
    require_auth(admin);
    if (ctx_.state.admin) {
        throw ReportingError(ErrorKind::AlreadyInitialized, "engine already initialized");
    }

    UnitOfWork uow(ctx_.state, ctx_.store, ctx_.events);
    uow.set_admin(admin);
    uow.commit();

    if (config_.verbose) {
        fmt::print(stderr, "[finrep] init admin={}\n", admin.value);
    }
}

void ReportingEngine::configure_addresses(const Identity& caller,
                                          const CollaboratorAddresses& addresses) {
    require_auth(caller);
    if (!ctx_.state.admin) {
        throw ReportingError(ErrorKind::NotInitialized, "engine not initialized");
    }
    if (caller != *ctx_.state.admin) {
        throw ReportingError(ErrorKind::Unauthorized,
                             fmt::format("'{}' is not the admin", caller.value));
    }

    UnitOfWork uow(ctx_.state, ctx_.store, ctx_.events);
    uow.set_addresses(addresses);
    uow.emit(make_event(ReportEvent::AddressesConfigured, caller, std::nullopt));
    uow.commit();

    if (config_.verbose) {
        fmt::print(stderr,
                   "[finrep] addresses configured split={} goals={} bills={} insurance={} family={}\n",
                   addresses.remittance_split.value, addresses.savings_goals.value,
                   addresses.bill_payments.value, addresses.insurance.value,
                   addresses.family_wallet.value);
    }
}

std::optional<CollaboratorAddresses> ReportingEngine::get_addresses() const {
    return ctx_.state.addresses;
}

std::optional<Identity> ReportingEngine::get_admin() const {
    return ctx_.state.admin;
}

// ─── Reports ──────────────────────────────────────────────────────────────────

RemittanceSummary ReportingEngine::get_remittance_summary(const Identity& /*user*/,
                                                          Amount total_amount,
                                                          Timestamp period_start,
                                                          Timestamp period_end) const {
    const RemittanceSummaryGenerator generator(remittance_split());
    return generator.summarize(total_amount, period_start, period_end);
}

SavingsReport ReportingEngine::get_savings_report(const Identity& user,
                                                  Timestamp period_start,
                                                  Timestamp period_end) const {
    const SavingsProgressCalculator calc(savings_goals());
    return calc.report(user, period_start, period_end);
}

BillComplianceReport ReportingEngine::get_bill_compliance_report(const Identity& user,
                                                                 Timestamp period_start,
                                                                 Timestamp period_end) const {
    const BillComplianceCalculator calc(bill_payments(), ctx_.clock);
    return calc.report(user, period_start, period_end);
}

InsuranceReport ReportingEngine::get_insurance_report(const Identity& user,
                                                      Timestamp period_start,
                                                      Timestamp period_end) const {
    const InsuranceCoverageCalculator calc(insurance());
    return calc.report(user, period_start, period_end);
}

HealthScore ReportingEngine::calculate_health_score(const Identity& user,
                                                    Amount /*total_remittance*/) const {
    const HealthScoreEngine scorer(savings_goals(), bill_payments(), insurance(), ctx_.clock);
    return scorer.calculate(user);
}

FinancialHealthReport
ReportingEngine::get_financial_health_report(const Identity& user,
                                             Amount total_remittance,
                                             Timestamp period_start,
                                             Timestamp period_end) {
    FinancialHealthReport report{
        .health_score       = calculate_health_score(user, total_remittance),
        .remittance_summary = get_remittance_summary(user, total_remittance,
                                                     period_start, period_end),
        .savings_report     = get_savings_report(user, period_start, period_end),
        .bill_compliance    = get_bill_compliance_report(user, period_start, period_end),
        .insurance_report   = get_insurance_report(user, period_start, period_end),
        .generated_at       = 0,
    };
    report.generated_at = collaborator_call("ledger_clock.now", [&] { return ctx_.clock.now(); });

    UnitOfWork uow(ctx_.state, ctx_.store, ctx_.events);
    uow.emit(make_event(ReportEvent::ReportGenerated, std::nullopt, report.generated_at));
    uow.commit();

    if (config_.verbose) {
        fmt::print(stderr, "[finrep] report generated user={} score={} at={}\n",
                   user.value, report.health_score.score, report.generated_at);
    }
    return report;
}

TrendData ReportingEngine::get_trend_analysis(const Identity& /*user*/,
                                              Amount current_amount,
                                              Amount previous_amount) const {
    return TrendAnalyzer::analyze(current_amount, previous_amount);
}

// ─── Storage ──────────────────────────────────────────────────────────────────

void ReportingEngine::store_report(const Identity& user,
                                   const FinancialHealthReport& report,
                                   PeriodKey period_key) {
    require_auth(user);

    UnitOfWork uow(ctx_.state, ctx_.store, ctx_.events);
    uow.put_report(user, period_key, report);
    uow.emit(make_event(ReportEvent::ReportStored, user, period_key));
    uow.commit();

    if (config_.verbose) {
        fmt::print(stderr, "[finrep] report stored user={} period_key={}\n",
                   user.value, period_key);
    }
}

std::optional<FinancialHealthReport>
ReportingEngine::get_stored_report(const Identity& user, PeriodKey period_key) const {
    return ctx_.store.get(user, period_key);
}

} // namespace finrep::core
