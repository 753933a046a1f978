//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: program/Listing.hpp
// Purpose: Read-only view of decoded instructions consumed by the enum applier.
// Key invariants: forEachInstruction visits addresses in ascending order.
// Ownership/Lifetime: Instructions passed to callbacks are only valid for the
//                     duration of the callback.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "program/Address.hpp"
#include "program/Scalar.hpp"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace eqtab::program
{

/// @brief One element of an operand's default representation: either a scalar
///        or a textual token such as a register name or punctuation.
using OperandPart = std::variant<Scalar, std::string>;

/// @brief Decoded machine instruction.
class Instruction
{
  public:
    virtual ~Instruction() = default;

    virtual Address address() const = 0;

    virtual int numOperands() const = 0;

    /// @brief Scalar for the whole operand, when the operand is a single scalar.
    virtual std::optional<Scalar> scalar(int opIndex) const = 0;

    /// @brief Default representation of operand @p opIndex split into parts.
    virtual std::vector<OperandPart> operandParts(int opIndex) const = 0;
};

/// @brief Source of instructions for a program.
class Listing
{
  public:
    /// @brief Return false from the callback to end the walk early.
    using InstructionCallback = std::function<bool(const Instruction &)>;

    virtual ~Listing() = default;

    /// @brief Visit every instruction whose address lies in @p addresses.
    virtual void forEachInstruction(const AddressSet &addresses,
                                    const InstructionCallback &callback) const = 0;
};

} // namespace eqtab::program
