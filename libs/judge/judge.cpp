/**
 * @file judge.cpp
 * @brief Slice report scoring
 */

#include "reposlice/judge.hpp"

#include "reposlice/schema_validate.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <iterator>
#include <utility>

namespace reposlice::judge {

namespace {

[[nodiscard]] double ratio(int numerator, int denominator)
{
    return denominator > 0 ? static_cast<double>(numerator) / denominator : 0.0;
}

[[nodiscard]] reposlice::Result<LineMap> line_map(const nlohmann::json& document,
                                                  const char* key,
                                                  const std::string& path)
{
    LineMap lines;
    if (!document.contains(key)) {
        return lines;
    }
    const auto& object = document.at(key);
    if (!object.is_object()) {
        return std::unexpected(Error::make("ParseError", std::format("{}: '{}' must be an object", path, key)));
    }
    for (const auto& [name, values] : object.items()) {
        if (!values.is_array()) {
            return std::unexpected(
                Error::make("ParseError", std::format("{}: '{}.{}' must be an array", path, key, name)));
        }
        auto& entry = lines[name];
        for (const auto& value : values) {
            if (!value.is_number_integer()) {
                return std::unexpected(Error::make(
                    "ParseError", std::format("{}: '{}.{}' must contain integers", path, key, name)));
            }
            entry.insert(value.get<int>());
        }
    }
    return lines;
}

[[nodiscard]] reposlice::Result<nlohmann::json> load_document(const std::string& path, const char* what)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(Error::make("IOError", std::format("{} file not found: {}", what, path)));
    }
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return document;
}

[[nodiscard]] nlohmann::json metrics_json(const Metrics& metrics)
{
    return nlohmann::json{
        {"true_positives", metrics.true_positives},
        {"false_positives", metrics.false_positives},
        {"false_negatives", metrics.false_negatives},
        {"precision", metrics.precision()},
        {"recall", metrics.recall()},
        {"f1_score", metrics.f1_score()},
    };
}

}  // namespace

double Metrics::precision() const
{
    return ratio(true_positives, true_positives + false_positives);
}

double Metrics::recall() const
{
    return ratio(true_positives, true_positives + false_negatives);
}

double Metrics::f1_score() const
{
    const double p = precision();
    const double r = recall();
    return p + r > 0.0 ? 2.0 * p * r / (p + r) : 0.0;
}

Metrics compare_lines(const std::set<int>& result, const std::set<int>& reference, const std::set<int>& whitelist)
{
    std::set<int> kept_result;
    std::set<int> kept_reference;
    std::ranges::set_difference(result, whitelist, std::inserter(kept_result, kept_result.end()));
    std::ranges::set_difference(reference, whitelist, std::inserter(kept_reference, kept_reference.end()));

    std::set<int> shared;
    std::ranges::set_intersection(kept_result, kept_reference, std::inserter(shared, shared.end()));
    const int tp = static_cast<int>(shared.size());
    return Metrics{
        .true_positives = tp,
        .false_positives = static_cast<int>(kept_result.size()) - tp,
        .false_negatives = static_cast<int>(kept_reference.size()) - tp,
    };
}

JudgeResult judge(std::string slicing_request_id, const LineMap& result, const ReferenceSlice& reference)
{
    JudgeResult judged{.slicing_request_id = std::move(slicing_request_id), .overall = {}, .functions = {}};

    std::set<std::string> names;
    for (const auto& [name, lines] : result) {
        names.insert(name);
    }
    for (const auto& [name, lines] : reference.relevant) {
        names.insert(name);
    }

    static const std::set<int> kNone;
    const auto lines_of = [](const LineMap& map, const std::string& name) -> const std::set<int>& {
        auto it = map.find(name);
        return it == map.end() ? kNone : it->second;
    };

    for (const auto& name : names) {
        const Metrics metrics = compare_lines(lines_of(result, name),
                                              lines_of(reference.relevant, name),
                                              lines_of(reference.whitelist, name));
        judged.overall.true_positives += metrics.true_positives;
        judged.overall.false_positives += metrics.false_positives;
        judged.overall.false_negatives += metrics.false_negatives;
        judged.functions.emplace(name, metrics);
    }
    return judged;
}

reposlice::Result<JudgeResult> judge_files(const std::string& slicing_request_id,
                                           const std::string& result_path,
                                           const std::string& oracle_dir)
{
    const std::string oracle_path = (std::filesystem::path(oracle_dir) / (slicing_request_id + ".json")).string();
    auto oracle_document = load_document(oracle_path, "Oracle");
    if (!oracle_document) {
        return std::unexpected(oracle_document.error());
    }
    auto result_document = load_document(result_path, "Result");
    if (!result_document) {
        return std::unexpected(result_document.error());
    }

    auto relevant = line_map(*oracle_document, "relevant_function_names_to_line_numbers", oracle_path);
    if (!relevant) {
        return std::unexpected(relevant.error());
    }
    auto whitelist = line_map(*oracle_document, "whitelist_line_numbers", oracle_path);
    if (!whitelist) {
        return std::unexpected(whitelist.error());
    }
    auto result = line_map(*result_document, "relevant_function_names_to_line_numbers", result_path);
    if (!result) {
        return std::unexpected(result.error());
    }
    return judge(slicing_request_id,
                 *result,
                 ReferenceSlice{.relevant = std::move(*relevant), .whitelist = std::move(*whitelist)});
}

nlohmann::json to_json(const JudgeResult& result)
{
    nlohmann::json functions = nlohmann::json::object();
    for (const auto& [name, metrics] : result.functions) {
        functions[name] = metrics_json(metrics);
    }
    return nlohmann::json{
        {"slicing_request_id", result.slicing_request_id},
        {"overall_metrics", metrics_json(result.overall)},
        {"function_metrics", std::move(functions)},
    };
}

}  // namespace reposlice::judge
