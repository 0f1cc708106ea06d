/**
 * @file control_flow.cpp
 * @brief Branch exclusivity and loop back-edge checks
 */

#include "reposlice/control_flow.hpp"

#include <algorithm>
#include <ranges>

namespace reposlice::analysis {

bool ControlFlowOracle::precedes(const model::Function& function, int src_line, int sink_line)
{
    if (src_line == sink_line) {
        return true;
    }

    for (const auto& scope : function.if_scopes() | std::views::values) {
        if (!scope.else_branch.is_empty() && scope.true_branch.contains(src_line)
            && scope.else_branch.contains(sink_line)) {
            return false;
        }
    }

    if (src_line > sink_line) {
        return std::ranges::any_of(function.loop_scopes() | std::views::values, [=](const model::LoopScope& loop) {
            return loop.body.contains(src_line) && loop.body.contains(sink_line);
        });
    }
    return true;
}

bool ControlFlowOracle::reachable(const model::Function& function, int src_line, int sink_line)
{
    return precedes(function, src_line, sink_line);
}

}  // namespace reposlice::analysis
