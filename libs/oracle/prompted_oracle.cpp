/**
 * @file prompted_oracle.cpp
 * @brief Prompt rendering, response parsing, retry and caching
 */

#include "reposlice/prompted_oracle.hpp"

#include "reposlice/log.hpp"
#include "reposlice/schema_validate.hpp"

#include <charconv>
#include <filesystem>
#include <format>
#include <ranges>
#include <regex>
#include <utility>

#include <nlohmann/json.hpp>

namespace reposlice::oracle {

namespace {

constexpr std::string_view kSliceMarker = "Slice:";
constexpr std::string_view kExternalMarker = "External Variables:";
constexpr std::string_view kLinesMarker = "Line numbers in the slice:";

void replace_all(std::string& text, std::string_view placeholder, std::string_view replacement)
{
    std::size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), replacement);
        pos += replacement.size();
    }
}

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines)
{
    std::string joined;
    for (const auto& [i, line] : std::views::enumerate(lines)) {
        if (i > 0) {
            joined += '\n';
        }
        joined += line;
    }
    return joined;
}

[[nodiscard]] std::optional<int> parse_int(std::string_view text)
{
    text = common::trim(text);
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<std::vector<int>> parse_line_list(std::string_view list)
{
    std::vector<int> lines;
    if (common::trim(list).empty()) {
        return lines;
    }
    for (auto part : list | std::views::split(',')) {
        auto value = parse_int(std::string_view(part.begin(), part.end()));
        if (!value) {
            return std::nullopt;
        }
        lines.push_back(*value);
    }
    return lines;
}

[[nodiscard]] std::optional<ExternalValueKind> kind_from_string(std::string_view text)
{
    if (text == "Parameter") {
        return ExternalValueKind::kParameter;
    }
    if (text == "Argument") {
        return ExternalValueKind::kArgument;
    }
    if (text == "Return Value") {
        return ExternalValueKind::kReturnValue;
    }
    if (text == "Output Value") {
        return ExternalValueKind::kOutputValue;
    }
    return std::nullopt;
}

/// One "- Type: ..." line. Fields always appear in this order when present.
[[nodiscard]] std::optional<ExternalValue> parse_descriptor(const std::string& line)
{
    static const std::regex kDescriptor(
        R"(^\s*-\s*Type:\s*(Output Value|Parameter|Argument|Return Value)\.)"
        R"((?:\s+Callee:\s*(\S+)\.)?)"
        R"((?:\s+Index:\s*(\d+)\.)?)"
        R"((?:\s+Name:\s*(\S+)\.)?)"
        R"((?:\s+Field Name:\s*([^\s.]+)\.)?)"
        R"((?:\s+Line:\s*(\d+)\.)?)"
        R"(\s*$)");

    std::smatch match;
    if (!std::regex_match(line, match, kDescriptor)) {
        return std::nullopt;
    }
    auto kind = kind_from_string(match[1].str());
    if (!kind) {
        return std::nullopt;
    }
    const auto group = [&match](std::size_t i) -> std::optional<std::string> {
        if (!match[i].matched) {
            return std::nullopt;
        }
        return match[i].str();
    };

    ExternalValue value{
        .kind = *kind,
        .callee_name = group(2),
        .index = std::nullopt,
        .line = std::nullopt,
        .variable_name = group(4),
        .field_name = group(5),
    };
    if (auto index = group(3)) {
        value.index = parse_int(*index);
    }
    if (auto line_number = group(6)) {
        value.line = parse_int(*line_number);
    }

    switch (value.kind) {
        case ExternalValueKind::kParameter:
            if (!value.index) {
                return std::nullopt;
            }
            break;
        case ExternalValueKind::kArgument:
            if (!value.callee_name || !value.index || !value.line) {
                return std::nullopt;
            }
            break;
        case ExternalValueKind::kOutputValue:
            if (!value.callee_name || !value.line) {
                return std::nullopt;
            }
            break;
        case ExternalValueKind::kReturnValue:
            break;
    }
    return value;
}

[[nodiscard]] reposlice::Result<std::vector<std::string>> string_list(const nlohmann::json& j,
                                                                     const char* key,
                                                                     const std::string& path)
{
    if (!j.contains(key) || !j.at(key).is_array()) {
        return std::unexpected(Error::make("ConfigError", std::format("{}: '{}' must be an array", path, key)));
    }
    std::vector<std::string> values;
    for (const auto& item : j.at(key)) {
        if (!item.is_string()) {
            return std::unexpected(
                Error::make("ConfigError", std::format("{}: '{}' must contain only strings", path, key)));
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

}  // namespace

reposlice::Result<PromptTemplate> PromptTemplate::load(const std::string& path)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(Error::make("ConfigError", document.error().message));
    }
    const nlohmann::json& j = *document;
    if (!j.is_object()) {
        return std::unexpected(Error::make("ConfigError", path + ": prompt template must be an object"));
    }
    for (const char* key : {"task", "question_template"}) {
        if (!j.contains(key) || !j.at(key).is_string()) {
            return std::unexpected(Error::make("ConfigError", std::format("{}: '{}' must be a string", path, key)));
        }
    }

    PromptTemplate prompt;
    prompt.task = j.at("task").get<std::string>();
    prompt.question_template = j.at("question_template").get<std::string>();
    auto rules = string_list(j, "analysis_rules", path);
    if (!rules) {
        return std::unexpected(rules.error());
    }
    auto examples = string_list(j, "analysis_examples", path);
    if (!examples) {
        return std::unexpected(examples.error());
    }
    auto meta = string_list(j, "meta_prompts", path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    auto answer = string_list(j, "answer_format", path);
    if (!answer) {
        return std::unexpected(answer.error());
    }
    prompt.analysis_rules = std::move(*rules);
    prompt.analysis_examples = std::move(*examples);
    prompt.meta_prompts = std::move(*meta);
    prompt.answer_format = std::move(*answer);
    return prompt;
}

reposlice::Result<std::unique_ptr<PromptedSliceOracle>>
PromptedSliceOracle::create(InferenceBackend& backend, PromptedOracleOptions options)
{
    const std::filesystem::path dir(options.prompt_dir);
    auto backward = PromptTemplate::load((dir / "backward_slicer.json").string());
    if (!backward) {
        return std::unexpected(backward.error());
    }
    auto forward = PromptTemplate::load((dir / "forward_slicer.json").string());
    if (!forward) {
        return std::unexpected(forward.error());
    }
    return std::make_unique<PromptedSliceOracle>(backend,
                                                 std::move(options),
                                                 std::move(*backward),
                                                 std::move(*forward));
}

PromptedSliceOracle::PromptedSliceOracle(InferenceBackend& backend,
                                         PromptedOracleOptions options,
                                         PromptTemplate backward,
                                         PromptTemplate forward)
    : m_backend(backend)
    , m_options(std::move(options))
    , m_backward(std::move(backward))
    , m_forward(std::move(forward))
{}

std::string PromptedSliceOracle::build_prompt(const SliceQuery& query) const
{
    const PromptTemplate& tmpl = query.is_backward() ? m_backward : m_forward;

    std::string prompt = tmpl.task;
    prompt += '\n' + join_lines(tmpl.analysis_rules);
    prompt += '\n' + join_lines(tmpl.analysis_examples);
    prompt += '\n' + join_lines(tmpl.meta_prompts);

    std::string question = tmpl.question_template;
    replace_all(question, "<SEED_DESCRIPTION>", query.seed_description());

    replace_all(prompt, "<FUNCTION>", query.function().lined_code());
    replace_all(prompt, "<QUESTION>", question);
    replace_all(prompt, "<ANSWER>", join_lines(tmpl.answer_format));
    return prompt;
}

std::optional<SliceResult> PromptedSliceOracle::parse_response(std::string_view response)
{
    const auto slice_pos = response.find(kSliceMarker);
    if (slice_pos == std::string_view::npos) {
        return std::nullopt;
    }
    const auto external_pos = response.find(kExternalMarker, slice_pos);
    if (external_pos == std::string_view::npos) {
        return std::nullopt;
    }
    const auto lines_pos = response.find(kLinesMarker, external_pos);
    if (lines_pos == std::string_view::npos) {
        return std::nullopt;
    }

    SliceResult result;
    const auto slice_begin = slice_pos + kSliceMarker.size();
    result.slice = std::string(common::trim(response.substr(slice_begin, external_pos - slice_begin)));

    const auto block_begin = external_pos + kExternalMarker.size();
    for (auto raw : response.substr(block_begin, lines_pos - block_begin) | std::views::split('\n')) {
        std::string line(raw.begin(), raw.end());
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!common::trim(line).starts_with('-')) {
            continue;
        }
        auto descriptor = parse_descriptor(line);
        if (!descriptor) {
            return std::nullopt;
        }
        result.external_values.push_back(std::move(*descriptor));
    }

    const std::string_view tail = response.substr(lines_pos + kLinesMarker.size());
    const auto open = tail.find('[');
    const auto close = tail.find(']', open == std::string_view::npos ? 0 : open);
    if (open == std::string_view::npos || close == std::string_view::npos
        || !common::trim(tail.substr(0, open)).empty()) {
        return std::nullopt;
    }
    auto lines = parse_line_list(tail.substr(open + 1, close - open - 1));
    if (!lines) {
        return std::nullopt;
    }
    result.lines = std::move(*lines);
    return result;
}

std::optional<SliceResult> PromptedSliceOracle::invoke(const SliceQuery& query)
{
    const SliceQueryKey key = query.key();
    {
        std::lock_guard lock(m_cache_mutex);
        if (auto it = m_cache.find(key); it != m_cache.end()) {
            ++m_cache_hits;
            REPOSLICE_LOG_DEBUG("Oracle cache hit for {}", query.function().name());
            return it->second;
        }
    }

    const std::string prompt = build_prompt(query);
    REPOSLICE_LOG_TRACE("Prompt for {}:\n{}", query.function().name(), prompt);

    for (int attempt = 1; attempt <= m_options.max_query_num; ++attempt) {
        {
            std::lock_guard lock(m_cache_mutex);
            ++m_backend_calls;
        }
        auto response = m_backend.complete(prompt);
        if (!response) {
            REPOSLICE_LOG_WARN("Oracle attempt {}/{} for {} failed: {}",
                               attempt,
                               m_options.max_query_num,
                               query.function().name(),
                               response.error().message);
            continue;
        }
        auto parsed = parse_response(*response);
        if (!parsed) {
            REPOSLICE_LOG_DEBUG("Oracle attempt {}/{} for {} returned an unparsable response",
                                attempt,
                                m_options.max_query_num,
                                query.function().name());
            continue;
        }
        std::lock_guard lock(m_cache_mutex);
        m_cache.insert_or_assign(key, *parsed);
        return parsed;
    }

    REPOSLICE_LOG_WARN("Oracle gave no usable answer for {} after {} attempt(s)",
                       query.function().name(),
                       m_options.max_query_num);
    return std::nullopt;
}

std::size_t PromptedSliceOracle::backend_calls() const
{
    std::lock_guard lock(m_cache_mutex);
    return m_backend_calls;
}

std::size_t PromptedSliceOracle::cache_hits() const
{
    std::lock_guard lock(m_cache_mutex);
    return m_cache_hits;
}

}  // namespace reposlice::oracle
