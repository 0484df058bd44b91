#pragma once

/// @file include/finrep/error.hpp
/// @brief Fatal error taxonomy for engine operations.
///
/// Every failure aborts the whole operation: nothing staged by the operation
/// is committed and no event is published. Zero denominators and empty
/// inputs are not errors; they resolve to documented defaults.

#include <stdexcept>
#include <string>
#include <string_view>

namespace finrep {

/// Category of a fatal engine failure.
enum class ErrorKind {
    NotInitialized,          ///< No admin recorded yet
    AlreadyInitialized,      ///< init() called on an initialized engine
    AddressesNotConfigured,  ///< Report requested before addresses were set
    Unauthorized,            ///< Identity failed authorization or is not admin
    CollaboratorFailure,     ///< Upstream call failed or address unresolvable
    ArithmeticOverflow,      ///< 128-bit accumulator would wrap
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Exception thrown by every fallible engine operation.
class ReportingError : public std::runtime_error {
public:
    ReportingError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace finrep
