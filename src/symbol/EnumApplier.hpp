//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: symbol/EnumApplier.hpp
// Purpose: Scan instructions for scalar operands matching an enumerated type's
//          legal values and bind each match to a type-derived equate.
// Key invariants: A scalar matches only at the type's bit width and with the
//                 scalar's own signedness. The type is registered at most once
//                 per scan, before the first binding.
// Ownership/Lifetime: Borrows the listing and registry for one scan. Binding
//                     is delegated to the caller, which holds the table lock.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "program/DataTypes.hpp"
#include "program/Listing.hpp"
#include "program/TaskMonitor.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace eqtab::symbol
{

using support::Expected;

/// @brief Counters and outcome of one scan.
struct ApplyResult
{
    program::TaskOutcome outcome = program::TaskOutcome::Completed;
    std::size_t instructionsVisited = 0;
    std::size_t bindings = 0;
};

class EnumApplier
{
  public:
    /// @brief Attach equate @p name (value @p value) at (@p address, @p opIndex).
    using BindFn = std::function<Expected<void>(
        std::string_view name, int64_t value, const program::Address &address, int opIndex)>;

    EnumApplier(const program::Listing &listing, program::TypeRegistry &types);

    /// @brief Walk @p addresses and bind every operand scalar declared by @p type.
    /// @param includeSubOperands Inspect each part of an operand's representation
    ///        instead of the operand's single scalar.
    /// @return Scan counters; the outcome is Cancelled when @p monitor asked to
    ///         stop. A binding failure aborts the scan and is returned as-is.
    Expected<ApplyResult> apply(const program::AddressSet &addresses,
                                const program::EnumType &type,
                                program::TaskMonitor &monitor,
                                bool includeSubOperands,
                                const BindFn &bind);

    /// @brief True when @p scalar equals one of @p type's values at the type's width.
    static bool matches(const program::EnumType &type, const program::Scalar &scalar);

  private:
    const program::Listing &listing_;
    program::TypeRegistry &types_;
};

} // namespace eqtab::symbol
