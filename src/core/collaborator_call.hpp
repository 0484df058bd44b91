#pragma once

/// @file src/core/collaborator_call.hpp
/// @brief Boundary wrapper for synchronous collaborator calls.

#include "finrep/error.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace finrep::core {

/// Invoke `fn` and translate any collaborator exception into
/// `ReportingError{CollaboratorFailure}` naming `what`, whatever type was
/// thrown. A `ReportingError` raised inside `fn` propagates unchanged.
/// No retry.
template <typename Fn>
decltype(auto) collaborator_call(std::string_view what, Fn&& fn) {
    try {
        return std::forward<Fn>(fn)();
    } catch (const ReportingError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ReportingError(ErrorKind::CollaboratorFailure,
                             std::string(what) + " failed: " + ex.what());
    } catch (...) {
        throw ReportingError(ErrorKind::CollaboratorFailure,
                             std::string(what) + " failed");
    }
}

} // namespace finrep::core
