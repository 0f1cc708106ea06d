/**
 * @file test_call_graph.cpp
 * @brief Callee name extraction and call-site resolution
 */

#include "reposlice/call_graph.hpp"

#include <gtest/gtest.h>

using namespace reposlice::model;
using reposlice::callgraph::callee_name_from_text;
using reposlice::callgraph::CallGraphResolver;

namespace {

Value make_value(FunctionId fn, std::string name, ValueLabel label, int index, int line = 1)
{
    return Value(ValueInit{
        .name = std::move(name),
        .label = label,
        .file_path = "/proj/shapes.cpp",
        .line_in_file = line,
        .function_id = fn,
        .function_name = "fn" + std::to_string(fn),
        .line_in_function = line,
        .index = index,
        .comment = std::nullopt,
    });
}

Function make_function(FunctionId id, std::string name)
{
    return Function(FunctionInit{.id = id,
                                 .name = std::move(name),
                                 .code = "{}",
                                 .start_line = 1,
                                 .end_line = 1,
                                 .file_path = "/proj/shapes.cpp",
                                 .decl = nullptr,
                                 .is_macro = false});
}

/// Add a callee with @p arity named parameters.
Function& add_callee(ProgramModel& model, FunctionId id, const std::string& name, int arity)
{
    Function fn = make_function(id, name);
    for (int i = 0; i < arity; ++i) {
        fn.add_parameter(make_value(id, "p" + std::to_string(i), ValueLabel::kPara, i));
    }
    return model.add_function(std::move(fn));
}

/// Add a call site with @p arg_count plain arguments to @p caller.
void add_call(Function& caller, CallSiteId site, const std::string& callee, int arg_count, bool receiver = false)
{
    caller.add_call_site(CallSite{.id = site,
                                  .callee_text = callee,
                                  .callee_name = callee,
                                  .start_line = site,
                                  .end_line = site,
                                  .text = callee + "(...)"});
    for (int i = 0; i < arg_count; ++i) {
        caller.add_argument(site, make_value(caller.id(), "a" + std::to_string(i), ValueLabel::kArg, i, site));
    }
    if (receiver) {
        caller.add_argument(site, make_value(caller.id(), "obj", ValueLabel::kObjArg, -1, site));
    }
}

}  // namespace

TEST(CalleeName, StripsQualifiersAndTemplateArguments)
{
    EXPECT_EQ(callee_name_from_text("foo"), "foo");
    EXPECT_EQ(callee_name_from_text("  foo  "), "foo");
    EXPECT_EQ(callee_name_from_text("obj.run"), "run");
    EXPECT_EQ(callee_name_from_text("ptr->next"), "next");
    EXPECT_EQ(callee_name_from_text("std::max"), "max");
    EXPECT_EQ(callee_name_from_text("obj->ns::run<int>"), "run");
    EXPECT_EQ(callee_name_from_text("make<std::vector<int>>"), "make");
    EXPECT_EQ(callee_name_from_text("compute(1, 2)"), "compute");
}

TEST(CallGraphResolver, OverloadsAreFilteredByArity)
{
    ProgramModel model;
    add_callee(model, 1, "area", 1);
    add_callee(model, 2, "area", 2);
    Function& caller = model.add_function(make_function(3, "main"));
    add_call(caller, 1, "area", 2);

    CallGraphResolver resolver(model);
    ASSERT_TRUE(resolver.resolve(caller).has_value());

    EXPECT_EQ(model.callees_at(3, 1), std::set<FunctionId>{2});
    EXPECT_TRUE(caller.function_call_sites().contains(1));
    EXPECT_TRUE(caller.api_call_sites().empty());
    EXPECT_TRUE(model.check_consistency().has_value());
}

TEST(CallGraphResolver, AmbiguousOverloadsKeepEveryCandidate)
{
    ProgramModel model;
    add_callee(model, 1, "swap", 2);
    add_callee(model, 2, "swap", 2);
    Function& caller = model.add_function(make_function(3, "main"));
    add_call(caller, 1, "swap", 2);

    ASSERT_TRUE(CallGraphResolver(model).resolve(caller).has_value());
    EXPECT_EQ(model.callees_at(3, 1), (std::set<FunctionId>{1, 2}));
}

TEST(CallGraphResolver, VariadicCalleeAcceptsExtraArguments)
{
    ProgramModel model;
    Function log = make_function(1, "log_msg");
    log.add_parameter(make_value(1, "fmt", ValueLabel::kPara, 0));
    log.add_parameter(make_value(1, "...", ValueLabel::kVariPara, 1));
    model.add_function(std::move(log));

    Function& caller = model.add_function(make_function(2, "main"));
    add_call(caller, 1, "log_msg", 3);
    add_call(caller, 2, "log_msg", 0);

    ASSERT_TRUE(CallGraphResolver(model).resolve(caller).has_value());
    EXPECT_EQ(model.callees_at(2, 1), std::set<FunctionId>{1});
    EXPECT_TRUE(model.callees_at(2, 2).empty());
    EXPECT_TRUE(caller.api_call_sites().contains(2));
}

TEST(CallGraphResolver, ReceiverShapeMustMatch)
{
    ProgramModel model;
    Function method = make_function(1, "run");
    method.add_parameter(make_value(1, "this", ValueLabel::kObjPara, -1));
    model.add_function(std::move(method));
    add_callee(model, 2, "run", 0);

    Function& caller = model.add_function(make_function(3, "main"));
    add_call(caller, 1, "run", 0, /*receiver=*/true);
    add_call(caller, 2, "run", 0, /*receiver=*/false);

    ASSERT_TRUE(CallGraphResolver(model).resolve(caller).has_value());
    EXPECT_EQ(model.callees_at(3, 1), std::set<FunctionId>{1});
    EXPECT_EQ(model.callees_at(3, 2), std::set<FunctionId>{2});
}

TEST(CallGraphResolver, UnresolvedCallsShareApisBySignature)
{
    ProgramModel model;
    Function& first = model.add_function(make_function(1, "first"));
    add_call(first, 1, "printf", 2);
    add_call(first, 2, "printf", 3);
    Function& second = model.add_function(make_function(2, "second"));
    add_call(second, 1, "printf", 2);

    CallGraphResolver resolver(model);
    ASSERT_TRUE(resolver.resolve(first).has_value());
    ASSERT_TRUE(resolver.resolve(second).has_value());

    ASSERT_EQ(model.apis().size(), 2U);
    const auto first_apis = model.apis_called_by(1);
    const auto second_apis = model.apis_called_by(2);
    ASSERT_EQ(first_apis.size(), 2U);
    ASSERT_EQ(second_apis.size(), 1U);
    EXPECT_TRUE(first_apis.contains(*second_apis.begin()));
    EXPECT_EQ(model.call_edges_into_api(*second_apis.begin()).size(), 2U);
    EXPECT_TRUE(model.check_consistency().has_value());
}

TEST(CallGraphResolver, RecursiveCallResolvesToItself)
{
    ProgramModel model;
    Function& fact = add_callee(model, 1, "fact", 1);
    add_call(fact, 1, "fact", 1);

    ASSERT_TRUE(CallGraphResolver(model).resolve(fact).has_value());
    EXPECT_EQ(model.callers_of(1), std::set<FunctionId>{1});
    EXPECT_EQ(model.transitive_callers(1, 5), std::set<FunctionId>{1});
}
