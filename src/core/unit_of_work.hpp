#pragma once

/// @file src/core/unit_of_work.hpp
/// @brief Staging area giving engine operations all-or-nothing semantics.
///
/// An operation records every intended side effect here while it runs.
/// Only `commit()` touches the persistent state, the report store and the
/// event sink. An operation that throws before `commit()` simply drops its
/// `UnitOfWork`, leaving no trace.

#include "finrep/config.hpp"
#include "finrep/events.hpp"
#include "finrep/report_store.hpp"
#include "finrep/reports.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace finrep::core {

class UnitOfWork {
public:
    UnitOfWork(ReportingState& state, ReportStore& store, EventSink& events) noexcept
        : state_(state), store_(store), events_(events) {}

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    void set_admin(const Identity& admin) { admin_ = admin; }
    void set_addresses(const CollaboratorAddresses& addresses) { addresses_ = addresses; }

    void put_report(const Identity& owner, PeriodKey period_key,
                    const FinancialHealthReport& report) {
        writes_.push_back(PendingWrite{owner, period_key, report});
    }

    void emit(EventRecord event) { pending_events_.push_back(std::move(event)); }

    /// Apply staged writes in order: store, singletons, then events.
    /// Events are published only once every write has landed. A failing
    /// store or sink surfaces as `ReportingError{CollaboratorFailure}` after
    /// the store entries and singletons written so far are restored.
    void commit();

    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    struct PendingWrite {
        Identity              owner;
        PeriodKey             period_key;
        FinancialHealthReport report;
    };

    ReportingState& state_;
    ReportStore&    store_;
    EventSink&      events_;

    std::optional<Identity>              admin_;
    std::optional<CollaboratorAddresses> addresses_;
    std::vector<PendingWrite>            writes_;
    std::vector<EventRecord>             pending_events_;
    bool                                 committed_ = false;
};

} // namespace finrep::core
