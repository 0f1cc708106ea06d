/**
 * @file config.cpp
 * @brief AnalysisConfig defaults, JSON overlay and validation
 */

#include "reposlice/config.hpp"

#include "reposlice/schema_validate.hpp"
#include "reposlice/version.hpp"

#include <format>
#include <utility>

namespace reposlice::io {

namespace {

[[nodiscard]] reposlice::Error config_error(std::string message)
{
    return Error::make("ConfigError", std::move(message));
}

}  // namespace

bool is_supported_language(std::string_view language)
{
    return language == "Cpp";
}

reposlice::VoidResult validate_config(const AnalysisConfig& config)
{
    if (!is_supported_language(config.language)) {
        return std::unexpected(
            config_error(std::format("Unsupported language '{}' (supported: Cpp)", config.language)));
    }
    if (config.jobs < 0) {
        return std::unexpected(config_error(std::format("jobs must not be negative, got {}", config.jobs)));
    }
    if (config.call_depth < 0) {
        return std::unexpected(
            config_error(std::format("call_depth must not be negative, got {}", config.call_depth)));
    }
    if (config.oracle.max_query_num < 0) {
        return std::unexpected(config_error(
            std::format("max_query_num must not be negative, got {}", config.oracle.max_query_num)));
    }
    if (config.oracle.timeout_seconds < 0) {
        return std::unexpected(config_error(
            std::format("timeout_seconds must not be negative, got {}", config.oracle.timeout_seconds)));
    }
    if (config.oracle.temperature < 0.0 || config.oracle.temperature > 2.0) {
        return std::unexpected(config_error(
            std::format("temperature must be within [0, 2], got {}", config.oracle.temperature)));
    }
    return {};
}

void apply_config_json(const nlohmann::json& j, AnalysisConfig& config)
{
    config.language = j.value("language", config.language);
    config.jobs = j.value("jobs", config.jobs);
    config.call_depth = j.value("call_depth", config.call_depth);
    if (j.contains("is_backward")) {
        config.is_backward = j.at("is_backward").get<bool>();
    }

    if (j.contains("oracle")) {
        const auto& oracle = j.at("oracle");
        config.oracle.max_query_num = oracle.value("max_query_num", config.oracle.max_query_num);
        config.oracle.model_name = oracle.value("model_name", config.oracle.model_name);
        config.oracle.temperature = oracle.value("temperature", config.oracle.temperature);
        config.oracle.command = oracle.value("command", config.oracle.command);
        config.oracle.timeout_seconds = oracle.value("timeout_seconds", config.oracle.timeout_seconds);
        config.oracle.prompt_dir = oracle.value("prompt_dir", config.oracle.prompt_dir);
    }
    if (j.contains("frontend")) {
        const auto& frontend = j.at("frontend");
        config.frontend.extra_args = frontend.value("extra_args", config.frontend.extra_args);
        config.frontend.extensions = frontend.value("extensions", config.frontend.extensions);
    }
}

reposlice::Result<AnalysisConfig> load_config(const std::string& path, std::string_view schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(config_error(document.error().message));
    }
    if (auto valid = common::validate_json_named(*document, schema_dir, kConfigSchemaVersion); !valid) {
        return std::unexpected(config_error("Invalid config " + path + ": " + valid.error().message));
    }
    AnalysisConfig config;
    apply_config_json(*document, config);
    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

nlohmann::json to_json(const AnalysisConfig& config)
{
    nlohmann::json j{
        {"language", config.language},
        {"jobs", config.jobs},
        {"call_depth", config.call_depth},
        {"oracle",
         {
             {"max_query_num", config.oracle.max_query_num},
             {"model_name", config.oracle.model_name},
             {"temperature", config.oracle.temperature},
             {"command", config.oracle.command},
             {"timeout_seconds", config.oracle.timeout_seconds},
             {"prompt_dir", config.oracle.prompt_dir},
         }},
        {"frontend",
         {
             {"extra_args", config.frontend.extra_args},
             {"extensions", config.frontend.extensions},
         }},
    };
    if (config.is_backward) {
        j["is_backward"] = *config.is_backward;
    }
    return j;
}

}  // namespace reposlice::io
