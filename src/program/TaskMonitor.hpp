//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: program/TaskMonitor.hpp
// Purpose: Cooperative cancellation and progress reporting for bulk operations.
// Key invariants: Once isCancelled() returns true it keeps returning true.
// Ownership/Lifetime: Monitors are borrowed for the duration of one operation.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>

namespace eqtab::program
{

/// @brief Polled by bulk operations once per enumerated record or instruction.
class TaskMonitor
{
  public:
    virtual ~TaskMonitor() = default;

    virtual bool isCancelled() const = 0;

    virtual void setMessage(std::string_view /*message*/) {}

    virtual void setProgress(uint64_t /*done*/, uint64_t /*total*/) {}

    /// @brief Shared monitor that never cancels and ignores progress.
    static TaskMonitor &dummy();
};

/// @brief Outcome of a cancellable bulk operation.
enum class TaskOutcome
{
    Completed,    ///< Ran to the end.
    Cancelled,    ///< Monitor requested cancellation; earlier work stays applied.
    StorageFailed ///< Storage failure reported to the error handler; aborted.
};

} // namespace eqtab::program
