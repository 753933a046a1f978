//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostics and the engine that collects them.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace eqtab::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Classification of a failure reported through a diagnostic.
/// @details Validation codes are caller-correctable; StorageFailure marks an
///          I/O failure in a backing adapter.
enum class ErrorCode
{
    None,            ///< Informational diagnostic without a failure class.
    DuplicateName,   ///< Name already bound to another equate.
    InvalidName,     ///< Name empty or blank after trimming.
    InvalidArgument, ///< Unknown key, unmappable address, or similar misuse.
    StorageFailure,  ///< Backing record store reported an I/O failure.
    Cancelled        ///< Bulk operation stopped by its monitor.
};

/// @brief Single diagnostic message.
struct Diagnostic
{
    Severity severity;                  ///< Message severity
    ErrorCode code = ErrorCode::None;   ///< Failure classification
    std::string message;                ///< Human-readable text
};

/// @brief Stable spelling of @p code used in printed diagnostics.
std::string_view toString(ErrorCode code) noexcept;

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Number of recorded diagnostics carrying @p code.
    size_t count(ErrorCode code) const;

    /// @brief Read-only view of everything reported so far.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace eqtab::support
