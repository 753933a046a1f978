//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: db/Records.hpp
// Purpose: Persistent record layouts for equates and equate references.
// Key invariants: Record keys are assigned by storage and never reused.
// Ownership/Lifetime: Plain values copied in and out of adapters.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace eqtab::db
{

/// @brief Storage-assigned record identifier.
using RecordKey = int64_t;

/// @brief Row of the equate table.
struct EquateRecord
{
    RecordKey key = 0;
    std::string name;
    int64_t value = 0;
};

/// @brief Row of the equate reference table.
/// @details dynamicHash == 0 means the slot is identified by opIndex alone.
struct EquateRefRecord
{
    RecordKey key = 0;
    int64_t addressKey = 0;
    int16_t opIndex = 0;
    uint64_t dynamicHash = 0;
    RecordKey equateKey = 0;
};

} // namespace eqtab::db
