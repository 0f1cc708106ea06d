#include "reposlice/schema_validate.hpp"
#include "reposlice/version.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace reposlice::common::test {

namespace {

nlohmann::json make_valid_request_json()
{
    return nlohmann::json{
        {"slicing_request_id", "slice_request_backward_01"},
        {      "project_path",                "/tmp/project"},
        {         "file_path",         "/tmp/project/main.c"},
        {  "seed_line_number",                             8},
        {         "seed_name",                           "t"},
        {       "is_backward",                          true}
    };
}

nlohmann::json make_valid_report_json()
{
    return nlohmann::json{
        {"slicing_request_id", "slice_request_backward_01"},
        {"relevant_function_names_to_line_numbers", {{"bar", {1, 3}}, {"foo", {5}}}}
    };
}

}  // namespace

TEST(SchemaValidate, ValidRequestPasses)
{
    auto result = validate_json_named(make_valid_request_json(), REPOSLICE_SCHEMA_DIR, kRequestSchemaVersion);
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidate, RequestWithoutSeedNameFails)
{
    auto request = make_valid_request_json();
    request.erase("seed_name");
    auto result = validate_json_named(request, REPOSLICE_SCHEMA_DIR, kRequestSchemaVersion);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, RequestWithStringLineFails)
{
    auto request = make_valid_request_json();
    request["seed_line_number"] = "8";
    auto result = validate_json_named(request, REPOSLICE_SCHEMA_DIR, kRequestSchemaVersion);
    EXPECT_FALSE(result.has_value());
}

TEST(SchemaValidate, ValidReportPasses)
{
    auto result = validate_json_named(make_valid_report_json(), REPOSLICE_SCHEMA_DIR, kReportSchemaVersion);
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidate, ReportWithNonIntegerLinesFails)
{
    auto report = make_valid_report_json();
    report["relevant_function_names_to_line_numbers"]["bar"] = nlohmann::json::array({"one"});
    auto result = validate_json_named(report, REPOSLICE_SCHEMA_DIR, kReportSchemaVersion);
    EXPECT_FALSE(result.has_value());
}

TEST(SchemaValidate, ConfigRejectsUnknownKey)
{
    nlohmann::json config{
        {"call_depth", 2},
        {"colour", "blue"}
    };
    auto result = validate_json_named(config, REPOSLICE_SCHEMA_DIR, kConfigSchemaVersion);
    EXPECT_FALSE(result.has_value());
}

TEST(SchemaValidate, MissingSchemaFileIsReported)
{
    auto result = validate_json_named(nlohmann::json::object(), REPOSLICE_SCHEMA_DIR, "no_such_schema.v1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace reposlice::common::test
