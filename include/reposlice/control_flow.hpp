#pragma once

/**
 * @file control_flow.hpp
 * @brief Line-range ordering queries over a function's if and loop scopes
 *
 * This is a coarse approximation of a control-flow graph: it only rules out
 * pairs of lines that sit in mutually exclusive branches, or that run
 * backwards outside any loop body covering both.
 */

#include "reposlice/function.hpp"

namespace reposlice::analysis {

class ControlFlowOracle
{
public:
    /**
     * Whether execution may reach @p sink_line after @p src_line within
     * @p function. Lines are absolute file lines.
     */
    [[nodiscard]] static bool precedes(const model::Function& function, int src_line, int sink_line);

    /// Same query as precedes(); ordering doubles as reachability.
    [[nodiscard]] static bool reachable(const model::Function& function, int src_line, int sink_line);
};

}  // namespace reposlice::analysis
