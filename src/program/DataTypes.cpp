//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "program/DataTypes.hpp"

namespace eqtab::program
{

std::vector<int64_t> EnumType::values() const
{
    std::vector<int64_t> out;
    out.reserve(members.size());
    for (const EnumMember &m : members)
        out.push_back(m.value);
    return out;
}

std::optional<std::string_view> EnumType::nameOf(int64_t value) const
{
    for (const EnumMember &m : members)
    {
        if (m.value == value)
            return std::string_view{m.name};
    }
    return std::nullopt;
}

} // namespace eqtab::program
