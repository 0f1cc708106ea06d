/**
 * @file test_config.cpp
 * @brief Analysis configuration loading and validation
 */

#include "reposlice/config.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using reposlice::io::AnalysisConfig;

namespace {

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

std::string write_config(const TempDir& dir, const nlohmann::json& j)
{
    const auto path = dir.path() / "config.json";
    std::ofstream(path) << j.dump(2);
    return path.string();
}

}  // namespace

TEST(Config, DefaultsAreValid)
{
    const AnalysisConfig config;
    EXPECT_EQ(config.language, "Cpp");
    EXPECT_EQ(config.call_depth, 3);
    EXPECT_EQ(config.oracle.max_query_num, 30);
    EXPECT_FALSE(config.is_backward.has_value());
    EXPECT_TRUE(reposlice::io::validate_config(config).has_value());
}

TEST(Config, RangeChecks)
{
    const auto rejected = [](auto mutate) {
        AnalysisConfig config;
        mutate(config);
        auto result = reposlice::io::validate_config(config);
        return !result.has_value() && result.error().code == "ConfigError";
    };
    EXPECT_TRUE(rejected([](AnalysisConfig& c) { c.language = "Java"; }));
    EXPECT_TRUE(rejected([](AnalysisConfig& c) { c.jobs = -1; }));
    EXPECT_TRUE(rejected([](AnalysisConfig& c) { c.call_depth = -2; }));
    EXPECT_TRUE(rejected([](AnalysisConfig& c) { c.oracle.max_query_num = -1; }));
    EXPECT_TRUE(rejected([](AnalysisConfig& c) { c.oracle.timeout_seconds = -5; }));
    EXPECT_TRUE(rejected([](AnalysisConfig& c) { c.oracle.temperature = 2.5; }));
    EXPECT_FALSE(rejected([](AnalysisConfig& c) { c.call_depth = 0; }));
}

TEST(Config, FileOverlaysDefaults)
{
    TempDir temp("reposlice_config_test");
    const auto path = write_config(temp,
                                   nlohmann::json{
                                       {"call_depth", 1},
                                       {"is_backward", false},
                                       {"oracle", {{"model_name", "local"}, {"command", "cat"}}},
                                       {"frontend", {{"extra_args", {"-DNDEBUG"}}}},
                                   });

    auto config = reposlice::io::load_config(path, REPOSLICE_SCHEMA_DIR);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->call_depth, 1);
    EXPECT_EQ(config->is_backward, false);
    EXPECT_EQ(config->oracle.model_name, "local");
    EXPECT_EQ(config->oracle.command, "cat");
    EXPECT_EQ(config->oracle.max_query_num, 30);
    EXPECT_EQ(config->frontend.extra_args, std::vector<std::string>{"-DNDEBUG"});
    EXPECT_EQ(config->frontend.extensions.size(), 5U);
}

TEST(Config, UnknownKeysAreRejected)
{
    TempDir temp("reposlice_config_unknown_test");
    const auto path = write_config(temp, nlohmann::json{{"calldepth", 2}});
    auto config = reposlice::io::load_config(path, REPOSLICE_SCHEMA_DIR);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "ConfigError");
}

TEST(Config, UnsupportedLanguageIsRejectedAfterLoading)
{
    TempDir temp("reposlice_config_language_test");
    const auto path = write_config(temp, nlohmann::json{{"language", "Go"}});
    auto config = reposlice::io::load_config(path, REPOSLICE_SCHEMA_DIR);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "ConfigError");
}

TEST(Config, JsonOmitsUnsetDirection)
{
    AnalysisConfig config;
    EXPECT_FALSE(reposlice::io::to_json(config).contains("is_backward"));
    config.is_backward = true;
    EXPECT_EQ(reposlice::io::to_json(config).at("is_backward"), true);
}
