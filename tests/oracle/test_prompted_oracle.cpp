/**
 * @file test_prompted_oracle.cpp
 * @brief Response parsing, prompt rendering, retries and caching
 */

#include "reposlice/prompted_oracle.hpp"

#include <deque>

#include <gtest/gtest.h>

#ifndef REPOSLICE_PROMPT_DIR
#define REPOSLICE_PROMPT_DIR "prompts"
#endif

using namespace reposlice::model;
using namespace reposlice::oracle;

namespace {

constexpr const char* kWellFormed = R"(Slice:
int r = scale(v);
return r;
External Variables:
- Type: Parameter. Index: 0. Name: v.
- Type: Output Value. Callee: scale. Line: 2.
Line numbers in the slice: [2, 3]
)";

/// Replays canned responses and counts calls.
class ScriptedBackend final : public InferenceBackend
{
public:
    explicit ScriptedBackend(std::deque<reposlice::Result<std::string>> responses)
        : m_responses(std::move(responses))
    {}

    reposlice::Result<std::string> complete(std::string_view prompt) override
    {
        ++calls;
        last_prompt = std::string(prompt);
        if (m_responses.empty()) {
            return std::unexpected(reposlice::Error::make("OracleError", "script exhausted"));
        }
        auto next = std::move(m_responses.front());
        m_responses.pop_front();
        return next;
    }

    int calls = 0;
    std::string last_prompt;

private:
    std::deque<reposlice::Result<std::string>> m_responses;
};

Function make_function()
{
    return Function(FunctionInit{.id = 2,
                                 .name = "apply",
                                 .code = "int apply(int v) {\n  int r = scale(v);\n  return r;\n}",
                                 .start_line = 5,
                                 .end_line = 8,
                                 .file_path = "/proj/apply.c",
                                 .decl = nullptr,
                                 .is_macro = false});
}

Value make_seed()
{
    return Value(ValueInit{
        .name = "r",
        .label = ValueLabel::kRet,
        .file_path = "/proj/apply.c",
        .line_in_file = 7,
        .function_id = 2,
        .function_name = "apply",
        .line_in_function = 3,
        .index = -1,
        .comment = std::nullopt,
    });
}

PromptTemplate make_template(std::string direction)
{
    PromptTemplate tmpl;
    tmpl.task = direction + " task for\n<FUNCTION>";
    tmpl.analysis_rules = {"rule one", "rule two"};
    tmpl.analysis_examples = {"example"};
    tmpl.meta_prompts = {"Question: <QUESTION>", "Answer like:", "<ANSWER>"};
    tmpl.question_template = "Slice <SEED_DESCRIPTION>.";
    tmpl.answer_format = {"Slice: ...", "Line numbers in the slice: [...]"};
    return tmpl;
}

PromptedSliceOracle make_oracle(ScriptedBackend& backend, int max_query_num)
{
    return PromptedSliceOracle(backend,
                               PromptedOracleOptions{.prompt_dir = "", .max_query_num = max_query_num},
                               make_template("backward"),
                               make_template("forward"));
}

}  // namespace

TEST(ParseResponse, ReadsSliceDescriptorsAndLines)
{
    auto parsed = PromptedSliceOracle::parse_response(kWellFormed);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->slice, "int r = scale(v);\nreturn r;");
    EXPECT_EQ(parsed->lines, (std::vector<int>{2, 3}));
    ASSERT_EQ(parsed->external_values.size(), 2U);

    const ExternalValue& param = parsed->external_values[0];
    EXPECT_EQ(param.kind, ExternalValueKind::kParameter);
    EXPECT_EQ(param.index, 0);
    EXPECT_EQ(param.variable_name, "v");

    const ExternalValue& output = parsed->external_values[1];
    EXPECT_EQ(output.kind, ExternalValueKind::kOutputValue);
    EXPECT_EQ(output.callee_name, "scale");
    EXPECT_EQ(output.line, 2);
}

TEST(ParseResponse, AcceptsEmptyExternalsAndLines)
{
    auto parsed = PromptedSliceOracle::parse_response(
        "Slice:\nnothing\nExternal Variables:\nLine numbers in the slice: []");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->external_values.empty());
    EXPECT_TRUE(parsed->lines.empty());
}

TEST(ParseResponse, AcceptsArgumentAndReturnValue)
{
    auto parsed = PromptedSliceOracle::parse_response(
        "Slice: x\r\nExternal Variables:\r\n- Type: Argument. Callee: log_msg. Index: 2. Line: 4.\r\n"
        "- Type: Return Value.\r\nLine numbers in the slice: [ 4 ]");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->external_values.size(), 2U);
    EXPECT_EQ(parsed->external_values[0].kind, ExternalValueKind::kArgument);
    EXPECT_EQ(parsed->external_values[0].index, 2);
    EXPECT_EQ(parsed->external_values[1].kind, ExternalValueKind::kReturnValue);
    EXPECT_EQ(parsed->lines, std::vector<int>{4});
}

TEST(ParseResponse, RejectsMalformedResponses)
{
    // Missing sections.
    EXPECT_FALSE(PromptedSliceOracle::parse_response("Line numbers in the slice: [1]").has_value());
    EXPECT_FALSE(PromptedSliceOracle::parse_response("Slice: a\nLine numbers in the slice: [1]").has_value());
    // Incomplete descriptors.
    EXPECT_FALSE(PromptedSliceOracle::parse_response(
                     "Slice: a\nExternal Variables:\n- Type: Parameter.\nLine numbers in the slice: [1]")
                     .has_value());
    EXPECT_FALSE(PromptedSliceOracle::parse_response(
                     "Slice: a\nExternal Variables:\n- Type: Argument. Callee: f. Line: 2.\n"
                     "Line numbers in the slice: [1]")
                     .has_value());
    EXPECT_FALSE(PromptedSliceOracle::parse_response(
                     "Slice: a\nExternal Variables:\n- Type: Global.\nLine numbers in the slice: [1]")
                     .has_value());
    // Bad line list.
    EXPECT_FALSE(PromptedSliceOracle::parse_response(
                     "Slice: a\nExternal Variables:\nLine numbers in the slice: [1, two]")
                     .has_value());
    EXPECT_FALSE(PromptedSliceOracle::parse_response("Slice: a\nExternal Variables:\nLine numbers in the slice: 1, 2")
                     .has_value());
}

TEST(PromptedOracle, BuildPromptFillsPlaceholders)
{
    ScriptedBackend backend({});
    auto oracle = make_oracle(backend, 1);
    const Function fn = make_function();
    auto query = SliceQuery::make(fn, {make_seed()}, true);
    ASSERT_TRUE(query.has_value());

    const std::string prompt = oracle.build_prompt(*query);
    EXPECT_TRUE(prompt.starts_with("backward task for\n1. int apply(int v) {"));
    EXPECT_NE(prompt.find("rule one\nrule two"), std::string::npos);
    EXPECT_NE(prompt.find("Question: Slice " + make_seed().description() + "."), std::string::npos);
    EXPECT_NE(prompt.find("Slice: ...\nLine numbers in the slice: [...]"), std::string::npos);
    EXPECT_EQ(prompt.find('<'), std::string::npos);

    auto forward = SliceQuery::make(fn, {make_seed()}, false);
    ASSERT_TRUE(forward.has_value());
    EXPECT_TRUE(oracle.build_prompt(*forward).starts_with("forward task"));
}

TEST(PromptedOracle, RetriesUntilAResponseParses)
{
    ScriptedBackend backend({std::unexpected(reposlice::Error::make("OracleError", "timeout")),
                             std::string("garbage"),
                             std::string(kWellFormed)});
    auto oracle = make_oracle(backend, 5);
    const Function fn = make_function();
    auto query = SliceQuery::make(fn, {make_seed()}, true);
    ASSERT_TRUE(query.has_value());

    auto result = oracle.invoke(*query);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->lines, (std::vector<int>{2, 3}));
    EXPECT_EQ(backend.calls, 3);
    EXPECT_EQ(oracle.backend_calls(), 3U);
}

TEST(PromptedOracle, GivesUpAfterMaxQueryNum)
{
    ScriptedBackend backend({std::string("no"), std::string("still no"), std::string(kWellFormed)});
    auto oracle = make_oracle(backend, 2);
    const Function fn = make_function();
    auto query = SliceQuery::make(fn, {make_seed()}, true);
    ASSERT_TRUE(query.has_value());

    EXPECT_FALSE(oracle.invoke(*query).has_value());
    EXPECT_EQ(backend.calls, 2);
}

TEST(PromptedOracle, RepeatedQueriesHitTheCache)
{
    ScriptedBackend backend({std::string(kWellFormed)});
    auto oracle = make_oracle(backend, 3);
    const Function fn = make_function();
    auto query = SliceQuery::make(fn, {make_seed()}, true);
    ASSERT_TRUE(query.has_value());

    auto first = oracle.invoke(*query);
    auto second = oracle.invoke(*query);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->lines, second->lines);
    EXPECT_EQ(backend.calls, 1);
    EXPECT_EQ(oracle.cache_hits(), 1U);
}

TEST(PromptedOracle, LoadsInstalledTemplates)
{
    ScriptedBackend backend({});
    auto oracle = PromptedSliceOracle::create(
        backend, PromptedOracleOptions{.prompt_dir = REPOSLICE_PROMPT_DIR "/Cpp", .max_query_num = 1});
    ASSERT_TRUE(oracle.has_value()) << oracle.error().message;

    const Function fn = make_function();
    auto query = SliceQuery::make(fn, {make_seed()}, false);
    ASSERT_TRUE(query.has_value());
    const std::string prompt = (*oracle)->build_prompt(*query);
    EXPECT_NE(prompt.find("forward slice"), std::string::npos);
    EXPECT_NE(prompt.find("2.   int r = scale(v);"), std::string::npos);
    EXPECT_EQ(prompt.find("<FUNCTION>"), std::string::npos);
    EXPECT_EQ(prompt.find("<QUESTION>"), std::string::npos);
}

TEST(PromptedOracle, MissingTemplateDirectoryIsAConfigError)
{
    ScriptedBackend backend({});
    auto oracle = PromptedSliceOracle::create(
        backend, PromptedOracleOptions{.prompt_dir = "/nonexistent/prompts", .max_query_num = 1});
    ASSERT_FALSE(oracle.has_value());
    EXPECT_EQ(oracle.error().code, "ConfigError");
}
