#pragma once

/**
 * @file judge.hpp
 * @brief Precision/recall evaluation of a slice report against a reference
 */

#include "reposlice/common.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace reposlice::judge {

using LineMap = std::map<std::string, std::set<int>>;

struct Metrics
{
    int true_positives = 0;
    int false_positives = 0;
    int false_negatives = 0;

    [[nodiscard]] double precision() const;
    [[nodiscard]] double recall() const;
    [[nodiscard]] double f1_score() const;
};

/// Reference slice with per-function lines excluded from scoring.
struct ReferenceSlice
{
    LineMap relevant;
    LineMap whitelist;
};

struct JudgeResult
{
    std::string slicing_request_id;
    Metrics overall;
    std::map<std::string, Metrics> functions;
};

/// Score one function's lines after dropping whitelisted ones from both sides.
[[nodiscard]] Metrics compare_lines(const std::set<int>& result,
                                    const std::set<int>& reference,
                                    const std::set<int>& whitelist);

/// Score every function named by either side; overall counts are summed.
[[nodiscard]] JudgeResult judge(std::string slicing_request_id,
                                const LineMap& result,
                                const ReferenceSlice& reference);

/**
 * Load "<oracle_dir>/<id>.json" and @p result_path and judge them.
 *
 * @return IOError if a file is missing, ParseError if a line map is malformed
 */
[[nodiscard]] reposlice::Result<JudgeResult> judge_files(const std::string& slicing_request_id,
                                                         const std::string& result_path,
                                                         const std::string& oracle_dir);

[[nodiscard]] nlohmann::json to_json(const JudgeResult& result);

}  // namespace reposlice::judge
