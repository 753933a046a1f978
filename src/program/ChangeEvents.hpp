//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: program/ChangeEvents.hpp
// Purpose: Change notifications emitted by the equate table.
// Key invariants: Each record carries enough payload to reconstruct the
//                 affected name, value, address and operand slot.
// Ownership/Lifetime: Records are values; sinks are borrowed.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "program/Address.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace eqtab::program
{

enum class ChangeKind
{
    EquateAdded,
    EquateRemoved,
    EquateRenamed,
    ReferenceAdded,
    ReferenceRemoved
};

/// @brief Snapshot of an equate and, for reference events, the location.
struct EquateInfo
{
    std::string name;
    int64_t value = 0;
    std::optional<Address> address; ///< Set for reference events only.
    int opIndex = 0;
    uint64_t dynamicHash = 0;
};

struct ChangeRecord
{
    ChangeKind kind = ChangeKind::EquateAdded;
    EquateInfo info;     ///< For renames, info.name is the old name.
    std::string newName; ///< Only set for EquateRenamed.
};

std::string_view toString(ChangeKind kind) noexcept;

/// @brief Receives change notifications; delivery is the sink's business.
class ChangeSink
{
  public:
    virtual ~ChangeSink() = default;

    virtual void notify(const ChangeRecord &record) = 0;
};

class NullChangeSink final : public ChangeSink
{
  public:
    void notify(const ChangeRecord &) override {}
};

} // namespace eqtab::program
