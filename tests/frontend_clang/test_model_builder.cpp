/**
 * @file test_model_builder.cpp
 * @brief Model construction from real C and C++ sources
 */

#include "reposlice/model_builder.hpp"
#include "reposlice/program_model.hpp"
#include "reposlice/slice_driver.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#ifndef REPOSLICE_CLANG_RESOURCE_DIR
#define REPOSLICE_CLANG_RESOURCE_DIR ""
#endif

namespace reposlice::frontend_clang::test {

namespace {

using model::Function;
using model::ValueLabel;

constexpr const char* kMainSource = "#define SQUARE(v) ((v) * (v))\n"  // 1
                                    "#define LIMIT 10\n"               // 2
                                    "\n"                               // 3
                                    "int foo(int x)\n"                 // 4
                                    "{\n"                              // 5
                                    "    int y = x + 1;\n"             // 6
                                    "    return y;\n"                  // 7
                                    "}\n"                              // 8
                                    "\n"                               // 9
                                    "int bar(int a, int b)\n"          // 10
                                    "{\n"                              // 11
                                    "    int c = foo(a);\n"            // 12
                                    "    if (c > LIMIT) {\n"           // 13
                                    "        c = SQUARE(b);\n"         // 14
                                    "    } else {\n"                   // 15
                                    "        c = 0;\n"                 // 16
                                    "    }\n"                          // 17
                                    "    while (c > 0) {\n"            // 18
                                    "        c--;\n"                   // 19
                                    "    }\n"                          // 20
                                    "    return c;\n"                  // 21
                                    "}\n";                             // 22

constexpr const char* kShapesSource = "struct Counter {\n"                               // 1
                                      "    int total = 0;\n"                             // 2
                                      "    int add(int v) { total += v; return total; }\n"  // 3
                                      "};\n"                                             // 4
                                      "\n"                                               // 5
                                      "int run(Counter& counter, int n)\n"               // 6
                                      "{\n"                                              // 7
                                      "    for (int i = 0; i < n; ++i) {\n"              // 8
                                      "        counter.add(i);\n"                        // 9
                                      "    }\n"                                          // 10
                                      "    return counter.add(n);\n"                     // 11
                                      "}\n";                                             // 12

constexpr const char* kLayoutSource = "static inline\n"                          // 1
                                      "int near_start(void) { return 1; }\n"     // 2
                                      "\n"                                       // 3
                                      "static\n"                                 // 4
                                      "unsigned\n"                               // 5
                                      "long far_away(void) { return 2; }\n"      // 6
                                      "int puts(const char* s);\n"               // 7
                                      "int log_all(const char* fmt, ...)\n"      // 8
                                      "{\n"                                      // 9
                                      "    return near_start() + puts(fmt);\n"   // 10
                                      "}\n";                                     // 11

/// Answers by (function name, label of the first seed).
class ScriptedOracle final : public oracle::SliceOracle
{
public:
    void answer(std::string function, ValueLabel label, oracle::SliceResult result)
    {
        m_answers.insert_or_assign({std::move(function), label}, std::move(result));
    }

    std::optional<oracle::SliceResult> invoke(const oracle::SliceQuery& query) override
    {
        auto it = m_answers.find({query.function().name(), query.seeds().front().label()});
        if (it == m_answers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::pair<std::string, ValueLabel>, oracle::SliceResult> m_answers;
};

class ModelBuilderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = std::filesystem::temp_directory_path() / "reposlice_model_builder_test";
        std::filesystem::remove_all(m_root);
        std::filesystem::create_directories(m_root / "src");
        write("src/main.c", kMainSource);
        write("src/shapes.cpp", kShapesSource);
        write("src/layout.c", kLayoutSource);
        write("src/notes.txt", "int ignored(void) { return 0; }\n");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    void write(const std::string& relative, const std::string& content) const
    {
        std::ofstream(m_root / relative) << content;
    }

    [[nodiscard]] std::string path_of(const std::string& relative) const
    {
        return common::normalize_path((m_root / relative).string());
    }

    [[nodiscard]] ModelBuildStats build(const std::vector<std::string>& extensions = {"c", "cpp"})
    {
        auto files = collect_source_files(m_root.string(), extensions);
        EXPECT_TRUE(files.has_value());
        ProgramModelBuilder builder(ModelBuildOptions{.project_root = m_root.string(),
                                                      .jobs = 2,
                                                      .extra_args = {},
                                                      .resource_dir = REPOSLICE_CLANG_RESOURCE_DIR});
        auto stats = builder.build(files.value_or(std::vector<std::string>{}), m_model);
        EXPECT_TRUE(stats.has_value()) << stats.error().message;
        return stats.value_or(ModelBuildStats{});
    }

    [[nodiscard]] const Function& only(const std::string& name) const
    {
        const auto ids = m_model.function_ids_by_name(name);
        EXPECT_EQ(ids.size(), 1U) << name;
        static const Function kMissing(model::FunctionInit{});
        return ids.empty() ? kMissing : *m_model.function(*ids.begin());
    }

    std::filesystem::path m_root;
    model::ProgramModel m_model;
};

}  // namespace

TEST_F(ModelBuilderTest, CollectsSourcesByExtension)
{
    auto files = collect_source_files(m_root.string(), {"c"});
    ASSERT_TRUE(files.has_value()) << files.error().message;
    ASSERT_EQ(files->size(), 2U);
    EXPECT_TRUE(std::ranges::is_sorted(*files));
    EXPECT_TRUE(files->front().ends_with("/src/layout.c"));

    auto missing = collect_source_files((m_root / "nope").string(), {"c"});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, "IOError");
}

TEST_F(ModelBuilderTest, FunctionsAndMacrosAreRegistered)
{
    const auto stats = build();
    EXPECT_EQ(stats.files_parsed, 3U);
    EXPECT_EQ(stats.files_dropped, 0U);
    EXPECT_EQ(stats.macros, 1U);

    const Function& foo = only("foo");
    EXPECT_EQ(foo.start_line(), 4);
    EXPECT_EQ(foo.end_line(), 8);
    EXPECT_EQ(foo.file_path(), path_of("src/main.c"));
    EXPECT_TRUE(foo.code().starts_with("int foo(int x)"));
    EXPECT_TRUE(foo.lined_code().starts_with("1. int foo(int x)\n2. {"));

    const Function& square = only("SQUARE");
    EXPECT_TRUE(square.is_macro());
    EXPECT_EQ(square.fixed_arity(), 1U);
    EXPECT_EQ(m_model.globals().at("LIMIT"), "10");
    EXPECT_TRUE(m_model.globals().at("SQUARE").starts_with("#define SQUARE(v)"));
    EXPECT_NE(m_model.file_content(path_of("src/main.c")), nullptr);
}

TEST_F(ModelBuilderTest, UnnamedTrailingParameterKeepsCallsResolved)
{
    write("src/callback.cpp",
          "int cb(int x, int)\n"          // 1
          "{\n"                           // 2
          "    return x;\n"               // 3
          "}\n"                           // 4
          "int handler(int)\n"            // 5
          "{\n"                           // 6
          "    return 0;\n"               // 7
          "}\n"                           // 8
          "int dispatch(void)\n"          // 9
          "{\n"                           // 10
          "    return cb(1, 2) + handler(3);\n"  // 11
          "}\n");                         // 12
    (void)build();

    const Function& cb = only("cb");
    const Function& handler = only("handler");
    const Function& dispatch = only("dispatch");
    EXPECT_EQ(cb.fixed_arity(), 2U);
    EXPECT_EQ(handler.fixed_arity(), 1U);
    EXPECT_EQ(m_model.callees_of(dispatch.id()), (std::set<model::FunctionId>{cb.id(), handler.id()}));
    EXPECT_TRUE(m_model.apis_called_by(dispatch.id()).empty());
}

TEST_F(ModelBuilderTest, HeaderLanguageFollowsSiblingSources)
{
    std::filesystem::create_directories(m_root / "clib");
    write("clib/list.h",
          "struct node { struct node *new; int value; };\n"  // 1
          "static int first_value(struct node *new)\n"       // 2
          "{\n"                                              // 3
          "    return new->value;\n"                         // 4
          "}\n");                                            // 5
    write("clib/list.c",
          "#include \"list.h\"\n"
          "int head(struct node *n) { return first_value(n); }\n");
    write("src/util.h", "namespace util {\ninline int twice(int v) { return v * 2; }\n}\n");

    const auto stats = build({"c", "cpp", "h"});
    EXPECT_EQ(stats.files_dropped, 0U);

    const auto c_dirs = c_header_directories({path_of("clib/list.c"), path_of("clib/list.h"),
                                              path_of("src/main.c"), path_of("src/shapes.cpp"),
                                              path_of("src/util.h")});
    EXPECT_EQ(c_dirs, std::set<std::string>{path_of("clib")});

    const Function& first_value = only("first_value");
    EXPECT_EQ(first_value.fixed_arity(), 1U);
    EXPECT_TRUE(std::ranges::any_of(first_value.parameters(),
                                    [](const model::Value& para) { return para.name() == "new"; }));
    EXPECT_EQ(m_model.function_ids_by_name("twice").size(), 1U);
}

TEST(HeaderLanguage, HeaderOnlyDirectoriesFollowTheProject)
{
    EXPECT_EQ(c_header_directories({"/p/inc/a.h", "/p/src/a.c"}),
              (std::set<std::string>{"/p/inc", "/p/src"}));
    EXPECT_TRUE(c_header_directories({"/p/inc/a.h", "/p/src/a.cpp"}).empty());
    EXPECT_TRUE(c_header_directories({"/p/src/a.h", "/p/src/a.c", "/p/src/b.cc"}).empty());
}

TEST_F(ModelBuilderTest, DeclaratorMustStartNearTheDefinition)
{
    (void)build();
    EXPECT_EQ(m_model.function_ids_by_name("near_start").size(), 1U);
    EXPECT_TRUE(m_model.function_ids_by_name("far_away").empty());
    EXPECT_TRUE(m_model.function_ids_by_name("ignored").empty());
}

TEST_F(ModelBuilderTest, ParametersAndReturnValues)
{
    (void)build();
    const Function& bar = only("bar");
    ASSERT_EQ(bar.parameters().size(), 2U);
    EXPECT_EQ(bar.parameter_at(1)->name(), "b");
    EXPECT_EQ(bar.parameter_at(1)->line_in_function(), 1);

    const Function& foo = only("foo");
    ASSERT_EQ(foo.return_values().size(), 1U);
    EXPECT_EQ(foo.return_values().begin()->name(), "y");
    EXPECT_EQ(foo.return_values().begin()->line_in_function(), 4);

    const Function& log_all = only("log_all");
    EXPECT_TRUE(log_all.is_variadic());
    EXPECT_EQ(log_all.fixed_arity(), 1U);
    EXPECT_EQ(log_all.parameter_at(3)->label(), ValueLabel::kVariPara);
}

TEST_F(ModelBuilderTest, CallSitesCarryArgumentsAndOutputs)
{
    (void)build();
    const Function& bar = only("bar");
    ASSERT_EQ(bar.call_sites().size(), 2U);

    const auto& first = bar.call_sites().at(1);
    EXPECT_EQ(first.callee_name, "foo");
    EXPECT_EQ(first.start_line, 3);
    EXPECT_EQ(first.text, "foo(a)");
    const auto args = bar.arguments({.call_site = 1});
    ASSERT_EQ(args.size(), 1U);
    EXPECT_EQ(args.front().name(), "a");
    EXPECT_EQ(args.front().index(), 0);
    EXPECT_EQ(bar.output_value(1)->name(), "foo(a)");

    const auto& second = bar.call_sites().at(2);
    EXPECT_EQ(second.callee_name, "SQUARE");
    EXPECT_EQ(second.start_line, 5);
    EXPECT_EQ(bar.arguments({.call_site = 2}).front().name(), "b");
}

TEST_F(ModelBuilderTest, MethodCallsHaveReceivers)
{
    (void)build();
    const Function& add = only("add");
    EXPECT_TRUE(add.has_receiver_parameter());

    const Function& run = only("run");
    ASSERT_EQ(run.call_sites().size(), 2U);
    EXPECT_TRUE(run.has_receiver_argument(1));
    EXPECT_EQ(run.argument_count(1), 1U);
    EXPECT_EQ(run.call_sites().at(1).callee_name, "add");
    EXPECT_EQ(m_model.callees_at(run.id(), 1), std::set<model::FunctionId>{add.id()});
}

TEST_F(ModelBuilderTest, BranchAndLoopScopes)
{
    (void)build();
    const Function& bar = only("bar");
    ASSERT_EQ(bar.if_scopes().size(), 1U);
    const auto& scope = bar.if_scopes().begin()->second;
    EXPECT_EQ(scope.condition, (model::LineSpan{13, 13}));
    EXPECT_EQ(scope.true_branch, (model::LineSpan{13, 15}));
    EXPECT_EQ(scope.else_branch, (model::LineSpan{15, 17}));

    ASSERT_EQ(bar.loop_scopes().size(), 1U);
    const auto& loop = bar.loop_scopes().begin()->second;
    EXPECT_EQ(loop.header, (model::LineSpan{18, 18}));
    EXPECT_EQ(loop.body, (model::LineSpan{19, 19}));

    const Function& run = only("run");
    ASSERT_EQ(run.loop_scopes().size(), 1U);
    EXPECT_EQ(run.loop_scopes().begin()->second.body, (model::LineSpan{9, 9}));
}

TEST_F(ModelBuilderTest, CallGraphLinksFunctionsMacrosAndApis)
{
    const auto stats = build();
    const Function& bar = only("bar");
    const Function& foo = only("foo");
    const Function& square = only("SQUARE");
    EXPECT_EQ(m_model.callees_of(bar.id()), (std::set<model::FunctionId>{foo.id(), square.id()}));
    EXPECT_EQ(m_model.callers_of(foo.id()), std::set<model::FunctionId>{bar.id()});

    const Function& log_all = only("log_all");
    EXPECT_EQ(m_model.callees_of(log_all.id()), std::set<model::FunctionId>{only("near_start").id()});
    ASSERT_EQ(stats.apis, 1U);
    EXPECT_EQ(m_model.apis().front().name, "puts");
    EXPECT_EQ(m_model.apis().front().parameter_count, 1U);
    EXPECT_TRUE(m_model.check_consistency().has_value());
}

TEST_F(ModelBuilderTest, UnparsableFilesAreDropped)
{
    write("src/broken.c", "#include \"does_not_exist.h\"\nint broken(void) { return 0; }\n");
    const auto stats = build();
    EXPECT_EQ(stats.files_dropped, 1U);
    EXPECT_EQ(stats.files_parsed, 3U);
    EXPECT_TRUE(m_model.function_ids_by_name("broken").empty());
}

TEST_F(ModelBuilderTest, BackwardSliceAcrossABuiltModel)
{
    (void)build();
    ScriptedOracle oracle;
    oracle.answer("bar",
                  ValueLabel::kSrc,
                  oracle::SliceResult{.slice = "",
                                      .lines = {3, 4, 5, 12},
                                      .external_values = {oracle::ExternalValue{
                                          .kind = oracle::ExternalValueKind::kOutputValue,
                                          .callee_name = "foo",
                                          .line = 3}}});
    oracle.answer("foo", ValueLabel::kRet, oracle::SliceResult{.slice = "", .lines = {1, 3, 4}, .external_values = {}});

    slicer::SliceDriver driver(m_model, oracle, slicer::SliceDriverOptions{.call_depth = 2});
    auto report = driver.run(io::SliceRequest{.slicing_request_id = "e2e",
                                              .project_path = m_root.string(),
                                              .file_path = path_of("src/main.c"),
                                              .seed_line_number = 21,
                                              .seed_name = "c",
                                              .is_backward = true});
    ASSERT_TRUE(report.has_value()) << report.error().message;
    const auto& lines = report->relevant_function_names_to_line_numbers;
    EXPECT_EQ(lines.at("bar"), (std::set<int>{3, 4, 5, 12}));
    EXPECT_EQ(lines.at("foo"), (std::set<int>{1, 3, 4}));
}

}  // namespace reposlice::frontend_clang::test
