//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: db/EquateAdapters.hpp
// Purpose: Storage interfaces backing the equate and reference tables.
// Key invariants: Every call either succeeds or reports a StorageFailure
//                 diagnostic; "not found" is a successful empty result.
// Ownership/Lifetime: Adapters are owned by the caller and borrowed by stores.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "db/Records.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace eqtab::db
{

using support::Expected;

/// @brief Keyed record store for equates with a unique name index.
class EquateAdapter
{
  public:
    virtual ~EquateAdapter() = default;

    virtual Expected<EquateRecord> createRecord(std::string_view name, int64_t value) = 0;

    virtual Expected<bool> hasRecord(std::string_view name) = 0;

    virtual Expected<std::optional<EquateRecord>> getRecord(RecordKey key) = 0;

    virtual Expected<std::optional<RecordKey>> getRecordKey(std::string_view name) = 0;

    /// @brief Overwrite the record with @p record.key, keeping the name index current.
    virtual Expected<void> updateRecord(const EquateRecord &record) = 0;

    virtual Expected<void> removeRecord(RecordKey key) = 0;

    /// @brief All records in storage iteration order.
    virtual Expected<std::vector<EquateRecord>> records() = 0;
};

/// @brief Keyed record store for references, indexed by address key and equate key.
class EquateRefAdapter
{
  public:
    virtual ~EquateRefAdapter() = default;

    virtual Expected<EquateRefRecord> createReference(int64_t addressKey,
                                                      int16_t opIndex,
                                                      uint64_t dynamicHash,
                                                      RecordKey equateKey) = 0;

    virtual Expected<std::optional<EquateRefRecord>> getRecord(RecordKey key) = 0;

    /// @brief Overwrite the record with @p record.key, re-indexing its address.
    virtual Expected<void> updateRecord(const EquateRefRecord &record) = 0;

    virtual Expected<void> removeRecord(RecordKey key) = 0;

    virtual Expected<std::vector<RecordKey>> getRecordKeysForAddr(int64_t addressKey) = 0;

    virtual Expected<std::vector<RecordKey>> getRecordKeysForEquate(RecordKey equateKey) = 0;

    /// @brief Smallest address key in [@p fromKey, @p toKey] holding a reference.
    virtual Expected<std::optional<int64_t>> nextAddressKey(int64_t fromKey, int64_t toKey) = 0;
};

} // namespace eqtab::db
