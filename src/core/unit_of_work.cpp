/// @file src/core/unit_of_work.cpp
/// @brief Commit step of the per-operation staging area.

#include "unit_of_work.hpp"

#include "collaborator_call.hpp"

namespace finrep::core {

void UnitOfWork::commit() {
    // Prior values of everything this commit overwrites, restored in reverse
    // if a later step fails.
    struct Undo {
        const PendingWrite*                  write;
        std::optional<FinancialHealthReport> prior;
    };
    std::vector<Undo> undo;
    undo.reserve(writes_.size());
    const auto prior_admin     = state_.admin;
    const auto prior_addresses = state_.addresses;

    try {
        for (const auto& w : writes_) {
            auto prior = collaborator_call("report store", [&] {
                return store_.get(w.owner, w.period_key);
            });
            collaborator_call("report store", [&] {
                store_.put(w.owner, w.period_key, w.report);
            });
            undo.push_back(Undo{&w, std::move(prior)});
        }

        if (admin_) {
            state_.admin = *admin_;
        }
        if (addresses_) {
            state_.addresses = *addresses_;
        }

        // Events go last. A sink that fails on event k has already received
        // events 0..k-1; engine operations stage at most one event.
        for (const auto& event : pending_events_) {
            collaborator_call("event sink", [&] { events_.publish(event); });
        }
    } catch (const ReportingError&) {
        state_.admin     = prior_admin;
        state_.addresses = prior_addresses;
        for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
            if (it->prior) {
                store_.put(it->write->owner, it->write->period_key, *it->prior);
            } else {
                store_.erase(it->write->owner, it->write->period_key);
            }
        }
        throw;
    }

    admin_.reset();
    addresses_.reset();
    writes_.clear();
    pending_events_.clear();
    committed_ = true;
}

} // namespace finrep::core
