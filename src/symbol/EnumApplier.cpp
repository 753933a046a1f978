//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements the enum-driven equate scan.
/// @details The scan visits each instruction once. Per operand it either takes
///          the operand's single scalar or, when sub-operands are requested,
///          every scalar part of the default representation; textual parts are
///          skipped. Matching scalars are named with formatNameForEquate using
///          the registered type's id so names always point back to a type the
///          registry knows about.
//
//===----------------------------------------------------------------------===//

#include "symbol/EnumApplier.hpp"

#include "symbol/EquateNames.hpp"

#include <optional>
#include <variant>

namespace eqtab::symbol
{

EnumApplier::EnumApplier(const program::Listing &listing, program::TypeRegistry &types)
    : listing_(listing), types_(types)
{
}

bool EnumApplier::matches(const program::EnumType &type, const program::Scalar &scalar)
{
    const unsigned bits = type.length * 8;
    for (int64_t v : type.values())
    {
        if (scalar == program::Scalar(bits, static_cast<uint64_t>(v), scalar.isSigned()))
            return true;
    }
    return false;
}

Expected<ApplyResult> EnumApplier::apply(const program::AddressSet &addresses,
                                         const program::EnumType &type,
                                         program::TaskMonitor &monitor,
                                         bool includeSubOperands,
                                         const BindFn &bind)
{
    ApplyResult result;
    std::optional<program::EnumType> registered;
    std::optional<support::Diag> failure;

    auto bindScalar = [&](const program::Instruction &insn,
                          int opIndex,
                          const program::Scalar &scalar) -> bool {
        if (!matches(type, scalar))
            return true;
        if (!registered)
        {
            auto known = types_.findById(type.id);
            registered = known ? *known : types_.addType(type);
        }
        const int64_t value = scalar.value();
        auto bound = bind(formatNameForEquate(registered->id, value), value, insn.address(), opIndex);
        if (!bound)
        {
            failure = bound.error();
            return false;
        }
        ++result.bindings;
        return true;
    };

    monitor.setMessage("Applying enum equates");
    listing_.forEachInstruction(addresses, [&](const program::Instruction &insn) {
        if (monitor.isCancelled())
        {
            result.outcome = program::TaskOutcome::Cancelled;
            return false;
        }
        ++result.instructionsVisited;
        for (int opIndex = 0; opIndex < insn.numOperands(); ++opIndex)
        {
            if (!includeSubOperands)
            {
                if (auto scalar = insn.scalar(opIndex))
                {
                    if (!bindScalar(insn, opIndex, *scalar))
                        return false;
                }
                continue;
            }
            for (const program::OperandPart &part : insn.operandParts(opIndex))
            {
                const auto *scalar = std::get_if<program::Scalar>(&part);
                if (scalar && !bindScalar(insn, opIndex, *scalar))
                    return false;
            }
        }
        return true;
    });

    if (failure)
        return *failure;
    return result;
}

} // namespace eqtab::symbol
