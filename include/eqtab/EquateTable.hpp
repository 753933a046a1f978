//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/eqtab/EquateTable.hpp
// Purpose: Public entry point for an equate table backed by in-memory storage.
// Invariants: The table owns its storage, address map and lock and forwards
//             every operation to a single EquateManager.
// Ownership: Callers keep ownership of the change sink, listing and type
//            registry passed in through EquateTableOptions.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "symbol/EquateManager.hpp"
#include "symbol/EquateNames.hpp"

#include <memory>
#include <mutex>

namespace eqtab
{

using symbol::Equate;
using symbol::EquateAddressIterator;
using symbol::EquateManager;
using symbol::EquateReference;
using symbol::EquateTableConfig;

/// @brief Construction parameters for an EquateTable.
struct EquateTableOptions
{
    EquateTableConfig config;                  ///< Cache, tracing and error hook settings.
    program::ChangeSink *changes = nullptr;    ///< Event sink; null discards events. Not owned.
    const program::Listing *listing = nullptr; ///< Needed by applyEnum. Not owned.
    program::TypeRegistry *types = nullptr;    ///< Needed by applyEnum and displayName. Not owned.
};

/// @brief Self-contained equate table with in-memory record storage.
class EquateTable
{
  public:
    explicit EquateTable(EquateTableOptions options = {});
    ~EquateTable();

    EquateTable(const EquateTable &) = delete;
    EquateTable &operator=(const EquateTable &) = delete;

    /// @brief Coordinator for every table operation.
    EquateManager &manager();

    /// @brief Lock guarding the table; hold it to batch reads of the raw storage.
    std::mutex &lock();

    /// @brief Number of stored equates.
    std::size_t equateCount() const;

    /// @brief Number of stored references.
    std::size_t referenceCount() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace eqtab
