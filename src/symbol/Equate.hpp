//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: symbol/Equate.hpp
// Purpose: Value snapshots of equates and equate references handed to callers.
// Key invariants: Snapshots are detached from the caches; they never observe
//                 later mutations and never dangle after invalidation.
// Ownership/Lifetime: Plain values.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "db/Records.hpp"
#include "program/Address.hpp"

#include <cstdint>
#include <string>

namespace eqtab::symbol
{

/// @brief Named binding of a symbolic label to an integer value.
struct Equate
{
    db::RecordKey id = 0;
    std::string name;
    int64_t value = 0;
};

/// @brief Association of a code location with an equate.
/// @details The slot is the operand index when dynamicHash is zero, otherwise
///          the hash identifies a sub-operand.
struct EquateReference
{
    db::RecordKey id = 0;
    program::Address address;
    int16_t opIndex = 0;
    uint64_t dynamicHash = 0;
    db::RecordKey equateId = 0;
};

} // namespace eqtab::symbol
