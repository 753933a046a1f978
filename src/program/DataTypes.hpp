//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: program/DataTypes.hpp
// Purpose: Enumerated value types and the registry that owns them.
// Key invariants: An EnumType's id is stable for the lifetime of the registry.
// Ownership/Lifetime: EnumType is a value; registries hand out copies.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eqtab::program
{

/// @brief Opaque 64-bit identity of a data type.
using TypeId = uint64_t;

struct EnumMember
{
    std::string name;
    int64_t value = 0;
};

/// @brief Enumerated type declaring a set of legal values at a fixed width.
struct EnumType
{
    TypeId id = 0;
    std::string name;
    unsigned length = 1; ///< Storage width in bytes.
    std::vector<EnumMember> members;

    /// @brief Declared values in member order; duplicates are kept.
    std::vector<int64_t> values() const;

    /// @brief Name of the first member declaring @p value.
    std::optional<std::string_view> nameOf(int64_t value) const;
};

/// @brief Data type registry lookups needed by the enum applier.
class TypeRegistry
{
  public:
    virtual ~TypeRegistry() = default;

    virtual std::optional<EnumType> findById(TypeId id) const = 0;

    /// @brief Register @p type unless a type with its id already exists.
    /// @return The registered form, which callers should use from then on.
    virtual EnumType addType(const EnumType &type) = 0;
};

} // namespace eqtab::program
