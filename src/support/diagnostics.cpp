/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates diagnostics raised by the equate table, most often
 *     storage failures routed through a StorageErrorHandler, and keeps track of
 *     severity counts.  Diagnostics are stored until callers print or inspect
 *     them.
 */
#include "diagnostics.hpp"

#include "diag_expected.hpp"

#include <algorithm>

namespace eqtab::support
{

/// @brief Map an error code to the identifier printed alongside a message.
std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::None:
            return "none";
        case ErrorCode::DuplicateName:
            return "duplicate-name";
        case ErrorCode::InvalidName:
            return "invalid-name";
        case ErrorCode::InvalidArgument:
            return "invalid-argument";
        case ErrorCode::StorageFailure:
            return "storage-failure";
        case ErrorCode::Cancelled:
            return "cancelled";
    }
    return "none";
}

/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * The diagnostic is appended for later inspection.  Errors and warnings bump
 * their counters; notes leave both unchanged.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so engine output matches what the
 * default storage-error handler prints.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

size_t DiagnosticEngine::count(ErrorCode code) const
{
    return static_cast<size_t>(std::count_if(
        diags_.begin(), diags_.end(), [code](const Diagnostic &d) { return d.code == code; }));
}
} // namespace eqtab::support
