//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: symbol/EquateNames.hpp
// Purpose: Encode and decode equate names derived from enumerated types.
// Key invariants: For every type id t and value v,
//                 typeIdFromEquateName(formatNameForEquate(t, v)) == t and
//                 valueFromEquateName(formatNameForEquate(t, v)) == v.
// Ownership/Lifetime: Pure functions over strings.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "program/DataTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace eqtab::symbol
{

/// @brief Leading tag of a type-derived equate name.
inline constexpr std::string_view kDataTypeTag = "dtID";

/// @brief Separator between the tag, type id and value fields.
inline constexpr std::string_view kFormatDelimiter = ":";

/// @brief Suffix of names rendered for values with no backing type.
inline constexpr std::string_view kErrorTag = "<BAD EQUATE>";

/// @brief Build `dtID:<typeId>:<value>` with both numbers in decimal.
std::string formatNameForEquate(program::TypeId typeId, int64_t value);

/// @brief Build `0x<hex> <BAD EQUATE>`; negative values keep a leading '-'.
std::string formatNameForEquateError(int64_t value);

/// @brief True when @p name starts with the type tag followed by the delimiter.
bool isDerivedEquateName(std::string_view name) noexcept;

/// @brief Recover the originating type id, or nullopt for manual or malformed names.
std::optional<program::TypeId> typeIdFromEquateName(std::string_view name);

/// @brief Recover the value, or nullopt for manual or malformed names.
std::optional<int64_t> valueFromEquateName(std::string_view name);

} // namespace eqtab::symbol
