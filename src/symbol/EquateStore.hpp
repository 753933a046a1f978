//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: symbol/EquateStore.hpp
// Purpose: CRUD over named equates with a read-through record cache.
// Key invariants: Names are unique and non-blank. Every successful create,
//                 remove and rename emits exactly one change record.
// Ownership/Lifetime: Borrows the adapter and change sink; owns its cache.
//                     Not synchronised: callers hold the table lock.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "db/EquateAdapters.hpp"
#include "db/ObjectCache.hpp"
#include "program/ChangeEvents.hpp"
#include "symbol/Equate.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace eqtab::symbol
{

using support::Expected;

class EquateStore
{
  public:
    EquateStore(db::EquateAdapter &adapter, program::ChangeSink &changes, std::size_t cacheCapacity);

    /// @brief Persist a new equate and emit EquateAdded.
    /// @return The new equate, or DuplicateName / InvalidName / StorageFailure.
    Expected<Equate> create(std::string_view name, int64_t value);

    /// @brief Equate named @p name; empty when no such equate exists.
    Expected<std::optional<Equate>> getByName(std::string_view name);

    /// @brief Equate with key @p id; empty when no such equate exists.
    Expected<std::optional<Equate>> getById(db::RecordKey id);

    /// @brief Every equate whose value equals @p value, in storage order.
    Expected<std::vector<Equate>> getByValue(int64_t value);

    /// @brief Every equate, in storage order.
    Expected<std::vector<Equate>> all();

    /// @brief Delete equate @p id and emit EquateRemoved with its old name.
    /// @pre The caller already detached every reference to @p id.
    Expected<void> remove(db::RecordKey id);

    /// @brief Rename equate @p id, then fire nameChanged().
    Expected<Equate> rename(db::RecordKey id, std::string_view newName);

    /// @brief Emit EquateRenamed; called after a successful record mutation.
    void nameChanged(std::string_view oldName, std::string_view newName);

    /// @brief Reject names that are empty or whitespace only.
    static Expected<void> validateName(std::string_view name);

    void invalidate()
    {
        cache_.invalidate();
    }

    const db::ObjectCache<db::EquateRecord> &cache() const noexcept
    {
        return cache_;
    }

  private:
    Expected<std::optional<db::EquateRecord>> lookup(db::RecordKey id);

    db::EquateAdapter &adapter_;
    program::ChangeSink &changes_;
    db::ObjectCache<db::EquateRecord> cache_;
};

} // namespace eqtab::symbol
