//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "program/ChangeEvents.hpp"

namespace eqtab::program
{

std::string_view toString(ChangeKind kind) noexcept
{
    switch (kind)
    {
        case ChangeKind::EquateAdded:
            return "EquateAdded";
        case ChangeKind::EquateRemoved:
            return "EquateRemoved";
        case ChangeKind::EquateRenamed:
            return "EquateRenamed";
        case ChangeKind::ReferenceAdded:
            return "ReferenceAdded";
        case ChangeKind::ReferenceRemoved:
            return "ReferenceRemoved";
    }
    return "EquateAdded";
}

} // namespace eqtab::program
