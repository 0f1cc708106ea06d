#pragma once

/**
 * @file prompted_oracle.hpp
 * @brief Prompt-driven slice oracle over an external inference backend
 */

#include "reposlice/common.hpp"
#include "reposlice/slice_oracle.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reposlice::oracle {

/// Text completion service: one prompt in, one response out.
class InferenceBackend
{
public:
    virtual ~InferenceBackend() = default;
    [[nodiscard]] virtual reposlice::Result<std::string> complete(std::string_view prompt) = 0;
};

struct CommandBackendOptions
{
    std::string command;  ///< run with /bin/sh -c
    std::string model_name;
    double temperature = 0.5;
    int timeout_seconds = 120;
};

/**
 * @brief Runs a shell command per prompt.
 *
 * The prompt is fed on stdin and the response read from stdout. The model
 * name and temperature are exported as REPOSLICE_MODEL and
 * REPOSLICE_TEMPERATURE. A non-zero exit status or a timeout is an
 * OracleError; on timeout the child is killed.
 */
class CommandInferenceBackend final : public InferenceBackend
{
public:
    explicit CommandInferenceBackend(CommandBackendOptions options);

    [[nodiscard]] reposlice::Result<std::string> complete(std::string_view prompt) override;

private:
    CommandBackendOptions m_options;
};

/// One direction's prompt template, as stored in "<direction>_slicer.json".
struct PromptTemplate
{
    std::string task;
    std::vector<std::string> analysis_rules;
    std::vector<std::string> analysis_examples;
    std::vector<std::string> meta_prompts;
    std::string question_template;
    std::vector<std::string> answer_format;

    [[nodiscard]] static reposlice::Result<PromptTemplate> load(const std::string& path);
};

struct PromptedOracleOptions
{
    std::string prompt_dir;
    int max_query_num = 30;
};

class PromptedSliceOracle final : public SliceOracle
{
public:
    /**
     * Load both direction templates from @p options.prompt_dir.
     *
     * @return ConfigError if a template is missing or malformed
     */
    [[nodiscard]] static reposlice::Result<std::unique_ptr<PromptedSliceOracle>>
    create(InferenceBackend& backend, PromptedOracleOptions options);

    PromptedSliceOracle(InferenceBackend& backend,
                        PromptedOracleOptions options,
                        PromptTemplate backward,
                        PromptTemplate forward);

    [[nodiscard]] std::string build_prompt(const SliceQuery& query) const;

    /**
     * Parse a backend response of the form
     * @code
     * Slice: ...
     * External Variables:
     * - Type: Parameter. Index: 0.
     * Line numbers in the slice: [2, 5]
     * @endcode
     * Returns std::nullopt if any part is missing or a descriptor is incomplete.
     */
    [[nodiscard]] static std::optional<SliceResult> parse_response(std::string_view response);

    [[nodiscard]] std::optional<SliceResult> invoke(const SliceQuery& query) override;

    [[nodiscard]] std::size_t backend_calls() const;
    [[nodiscard]] std::size_t cache_hits() const;

private:
    InferenceBackend& m_backend;
    PromptedOracleOptions m_options;
    PromptTemplate m_backward;
    PromptTemplate m_forward;

    mutable std::mutex m_cache_mutex;
    std::map<SliceQueryKey, SliceResult> m_cache;
    std::size_t m_backend_calls = 0;
    std::size_t m_cache_hits = 0;
};

}  // namespace reposlice::oracle
