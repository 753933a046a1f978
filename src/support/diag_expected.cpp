//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the equate
// table.  Storage adapters, stores and the coordinator all report failures as
// Diag payloads; keeping construction and printing here gives every layer the
// same wording.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "diag_expected.hpp"

namespace eqtab::support
{

/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must ensure the `Expected` represents an error first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided classification.
/// @param code Failure class stored on the diagnostic.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity.
Diag makeError(ErrorCode code, std::string msg)
{
    return Diag{Severity::Error, code, std::move(msg)};
}

Diag makeStorageError(std::string msg)
{
    return makeError(ErrorCode::StorageFailure, std::move(msg));
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details Emits "<severity>[<code>]: <message>" and a trailing newline so
///          consecutive diagnostics form a contiguous block.  Diagnostics
///          without a failure class drop the bracketed code.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diag &diag, std::ostream &os)
{
    os << detail::diagSeverityToString(diag.severity);
    if (diag.code != ErrorCode::None)
        os << '[' << toString(diag.code) << ']';
    os << ": " << diag.message << '\n';
}
} // namespace eqtab::support
