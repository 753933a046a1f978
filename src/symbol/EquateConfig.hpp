//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: symbol/EquateConfig.hpp
// Purpose: Tunables and hooks for an equate table instance.
// Key invariants: Cache capacities below one are clamped to one.
// Ownership/Lifetime: Value type copied into the EquateManager; the trace
//                     stream is borrowed and must outlive the manager.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>

namespace eqtab::symbol
{

/// @brief Receives storage failures; the handler decides what the program does next.
using StorageErrorHandler = std::function<void(const support::Diag &)>;

/// @brief Settings applied when an EquateManager is constructed.
struct EquateTableConfig
{
    /// @brief Capacity of the equate record cache.
    std::size_t equateCacheCapacity = 100;

    /// @brief Capacity of the reference record cache.
    std::size_t referenceCacheCapacity = 100;

    /// @brief Emit one `[equates]` line per mutation.
    bool trace = false;

    /// @brief Destination for trace lines; nullptr selects std::cerr.
    std::ostream *traceStream = nullptr;

    /// @brief Storage failure hook; empty prints the diagnostic to std::cerr.
    StorageErrorHandler onStorageError;
};

} // namespace eqtab::symbol
