/**
 * @file test_control_flow.cpp
 * @brief Branch exclusivity and loop ordering queries
 */

#include "reposlice/control_flow.hpp"

#include <gtest/gtest.h>

using namespace reposlice::model;
using reposlice::analysis::ControlFlowOracle;

namespace {

/// Lines 1-40: if (9) with then [10,12] and else [14,16]; while (19) body [20,30].
Function make_function()
{
    Function fn(FunctionInit{.id = 1,
                             .name = "step",
                             .code = "{}",
                             .start_line = 1,
                             .end_line = 40,
                             .file_path = "/proj/step.c",
                             .decl = nullptr,
                             .is_macro = false});
    fn.add_if_scope(LineSpan{9, 16},
                    IfScope{.condition = {9, 9},
                            .condition_text = "x > 0",
                            .true_branch = {10, 12},
                            .else_branch = {14, 16}});
    fn.add_if_scope(LineSpan{32, 34},
                    IfScope{.condition = {32, 32}, .condition_text = "done", .true_branch = {33, 34}, .else_branch = {}});
    fn.add_loop_scope(LineSpan{19, 30},
                      LoopScope{.header = {19, 19}, .header_text = "i < n", .body = {20, 30}});
    return fn;
}

}  // namespace

TEST(ControlFlow, SameLineAlwaysPrecedes)
{
    const Function fn = make_function();
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 11, 11));
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 38, 38));
}

TEST(ControlFlow, ForwardOrderOutsideBranches)
{
    const Function fn = make_function();
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 2, 9));
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 11, 18));
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 33, 36));
}

TEST(ControlFlow, ExclusiveBranchesDoNotPrecede)
{
    const Function fn = make_function();
    EXPECT_FALSE(ControlFlowOracle::precedes(fn, 11, 15));
    EXPECT_FALSE(ControlFlowOracle::reachable(fn, 10, 16));
}

TEST(ControlFlow, BackwardOrderNeedsCommonLoopBody)
{
    const Function fn = make_function();
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 25, 22));
    EXPECT_FALSE(ControlFlowOracle::precedes(fn, 36, 22));
    EXPECT_FALSE(ControlFlowOracle::precedes(fn, 8, 3));
}

TEST(ControlFlow, LoopBodyMustCoverBothLines)
{
    Function fn = make_function();
    fn.add_loop_scope(LineSpan{35, 38}, LoopScope{.header = {35, 35}, .header_text = "", .body = {36, 38}});
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 38, 36));
    EXPECT_FALSE(ControlFlowOracle::precedes(fn, 36, 21));
}

TEST(ControlFlow, BackwardOrderOutsideShortLoopBody)
{
    Function fn(FunctionInit{.id = 2,
                             .name = "drain",
                             .code = "{}",
                             .start_line = 1,
                             .end_line = 30,
                             .file_path = "/proj/drain.c",
                             .decl = nullptr,
                             .is_macro = false});
    fn.add_loop_scope(LineSpan{19, 23}, LoopScope{.header = {19, 19}, .header_text = "n--", .body = {20, 23}});
    EXPECT_TRUE(ControlFlowOracle::precedes(fn, 23, 21));
    EXPECT_FALSE(ControlFlowOracle::precedes(fn, 25, 22));
}
