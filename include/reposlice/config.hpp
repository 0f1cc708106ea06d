#pragma once

/**
 * @file config.hpp
 * @brief Analysis configuration with defaults and JSON loading
 */

#include "reposlice/common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace reposlice::io {

struct OracleSettings
{
    int max_query_num = 30;
    std::string model_name = "gpt-5-mini";
    double temperature = 0.5;
    std::string command;
    int timeout_seconds = 120;
    std::string prompt_dir = "prompts/Cpp";
};

struct FrontendSettings
{
    std::vector<std::string> extra_args;
    std::vector<std::string> extensions = {"cpp", "cc", "hpp", "c", "h"};
};

struct AnalysisConfig
{
    std::string language = "Cpp";
    int jobs = 0;
    int call_depth = 3;
    std::optional<bool> is_backward;  ///< unset: the request's own direction
    OracleSettings oracle;
    FrontendSettings frontend;
};

/// Languages accepted by validate_config().
[[nodiscard]] bool is_supported_language(std::string_view language);

/**
 * @return ConfigError for an unsupported language, a negative job count, call
 * depth, retry budget or timeout, or a temperature outside [0, 2]
 */
[[nodiscard]] reposlice::VoidResult validate_config(const AnalysisConfig& config);

/**
 * Overlay the keys present in @p j onto @p config. @p j must already have
 * passed analysis_config.v1.schema.json.
 */
void apply_config_json(const nlohmann::json& j, AnalysisConfig& config);

/// Defaults overlaid with a schema-checked config file.
[[nodiscard]] reposlice::Result<AnalysisConfig> load_config(const std::string& path,
                                                            std::string_view schema_dir);

[[nodiscard]] nlohmann::json to_json(const AnalysisConfig& config);

}  // namespace reposlice::io
