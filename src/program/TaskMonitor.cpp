//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "program/TaskMonitor.hpp"

namespace eqtab::program
{
namespace
{
class DummyMonitor final : public TaskMonitor
{
  public:
    bool isCancelled() const override
    {
        return false;
    }
};
} // namespace

TaskMonitor &TaskMonitor::dummy()
{
    static DummyMonitor monitor;
    return monitor;
}

} // namespace eqtab::program
