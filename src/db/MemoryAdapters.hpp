//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: db/MemoryAdapters.hpp
// Purpose: In-memory implementations of the equate storage adapters.
// Key invariants: Secondary indices (name, address, equate) always mirror the
//                 primary record map. Keys come from a counter and are never
//                 reused, even after removal.
// Ownership/Lifetime: Each adapter owns its records.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "db/EquateAdapters.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>

namespace eqtab::db
{

class MemoryEquateAdapter final : public EquateAdapter
{
  public:
    Expected<EquateRecord> createRecord(std::string_view name, int64_t value) override;
    Expected<bool> hasRecord(std::string_view name) override;
    Expected<std::optional<EquateRecord>> getRecord(RecordKey key) override;
    Expected<std::optional<RecordKey>> getRecordKey(std::string_view name) override;
    Expected<void> updateRecord(const EquateRecord &record) override;
    Expected<void> removeRecord(RecordKey key) override;
    Expected<std::vector<EquateRecord>> records() override;

    size_t size() const noexcept
    {
        return records_.size();
    }

  private:
    std::map<RecordKey, EquateRecord> records_;
    std::map<std::string, RecordKey, std::less<>> byName_;
    RecordKey nextKey_ = 1;
};

class MemoryEquateRefAdapter final : public EquateRefAdapter
{
  public:
    Expected<EquateRefRecord> createReference(int64_t addressKey,
                                              int16_t opIndex,
                                              uint64_t dynamicHash,
                                              RecordKey equateKey) override;
    Expected<std::optional<EquateRefRecord>> getRecord(RecordKey key) override;
    Expected<void> updateRecord(const EquateRefRecord &record) override;
    Expected<void> removeRecord(RecordKey key) override;
    Expected<std::vector<RecordKey>> getRecordKeysForAddr(int64_t addressKey) override;
    Expected<std::vector<RecordKey>> getRecordKeysForEquate(RecordKey equateKey) override;
    Expected<std::optional<int64_t>> nextAddressKey(int64_t fromKey, int64_t toKey) override;

    size_t size() const noexcept
    {
        return records_.size();
    }

  private:
    void index(const EquateRefRecord &rec);
    void unindex(const EquateRefRecord &rec);

    std::map<RecordKey, EquateRefRecord> records_;
    std::map<int64_t, std::set<RecordKey>> byAddress_;
    std::map<RecordKey, std::set<RecordKey>> byEquate_;
    RecordKey nextKey_ = 1;
};

} // namespace eqtab::db
