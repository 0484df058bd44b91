#pragma once

/// @file include/finrep/config.hpp
/// @brief Engine configuration and the persistent configuration singletons.

#include "finrep/types.hpp"

#include <optional>

namespace finrep {

/// Addresses of the collaborators, set by the admin.
struct CollaboratorAddresses {
    Identity remittance_split;
    Identity savings_goals;
    Identity bill_payments;
    Identity insurance;
    Identity family_wallet;  ///< Recorded and returned; no report reads it

    friend bool operator==(const CollaboratorAddresses&, const CollaboratorAddresses&) = default;
};

/// Persistent singleton records: the admin identity and the configured
/// collaborator addresses. Owned by the caller and passed to the engine by
/// reference; the engine writes it only when an operation commits.
struct ReportingState {
    std::optional<Identity>              admin;
    std::optional<CollaboratorAddresses> addresses;
};

/// Runtime options for the engine.
struct EngineConfig {
    /// If true, trace every operation to stderr.
    bool verbose = false;
};

} // namespace finrep
