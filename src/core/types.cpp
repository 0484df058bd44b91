/// @file src/core/types.cpp
/// @brief Name tables for the shared enumerations and the error type.

#include "finrep/error.hpp"
#include "finrep/events.hpp"
#include "finrep/types.hpp"

namespace finrep {

std::string_view to_string(Category category) noexcept {
    switch (category) {
        case Category::Spending:  return "Spending";
        case Category::Savings:   return "Savings";
        case Category::Bills:     return "Bills";
        case Category::Insurance: return "Insurance";
    }
    return "Unknown";
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotInitialized:         return "NotInitialized";
        case ErrorKind::AlreadyInitialized:     return "AlreadyInitialized";
        case ErrorKind::AddressesNotConfigured: return "AddressesNotConfigured";
        case ErrorKind::Unauthorized:           return "Unauthorized";
        case ErrorKind::CollaboratorFailure:    return "CollaboratorFailure";
        case ErrorKind::ArithmeticOverflow:     return "ArithmeticOverflow";
    }
    return "Unknown";
}

ReportingError::ReportingError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{}

std::string_view to_string(ReportEvent event) noexcept {
    switch (event) {
        case ReportEvent::ReportGenerated:     return "ReportGenerated";
        case ReportEvent::ReportStored:        return "ReportStored";
        case ReportEvent::AddressesConfigured: return "AddressesConfigured";
    }
    return "Unknown";
}

} // namespace finrep
