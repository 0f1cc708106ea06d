/**
 * @file main.cpp
 * @brief reposlice CLI entry point
 *
 * Commands:
 *   slice     - Interprocedural slice for one slicing request
 *   model     - Build the program model and dump it as JSON
 *   judge     - Score a slice report against a reference slice
 *   version   - Show version information
 */

#include "reposlice/common.hpp"
#include "reposlice/config.hpp"
#include "reposlice/judge.hpp"
#include "reposlice/log.hpp"
#include "reposlice/model_builder.hpp"
#include "reposlice/program_model.hpp"
#include "reposlice/prompted_oracle.hpp"
#include "reposlice/require_cpp23.hpp"
#include "reposlice/slice_driver.hpp"
#include "reposlice/slice_report.hpp"
#include "reposlice/slice_request.hpp"
#include "reposlice/version.hpp"

#include <charconv>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#ifndef REPOSLICE_SCHEMA_DIR
    #define REPOSLICE_SCHEMA_DIR "schemas"
#endif
#ifndef REPOSLICE_PROMPT_DIR
    #define REPOSLICE_PROMPT_DIR "prompts"
#endif
#ifndef REPOSLICE_CLANG_RESOURCE_DIR
    #define REPOSLICE_CLANG_RESOURCE_DIR ""
#endif

namespace {

void print_version()
{
    std::println("reposlice {} ({})", reposlice::kVersion, reposlice::kBuildId);
    std::println("  request: {}", reposlice::kRequestSchemaVersion);
    std::println("  report:  {}", reposlice::kReportSchemaVersion);
    std::println("  config:  {}", reposlice::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(reposlice - Interprocedural program slicer for C/C++

Usage: reposlice <command> [options]

Commands:
  slice       Slice from the seed of a slicing request
  model       Build the program model and dump it as JSON
  judge       Compare a slice report with a reference slice
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'reposlice <command> --help' for command-specific options.
)");
}

void print_slice_help()
{
    std::print(R"(Usage: reposlice slice [options]

Slice from the seed of a slicing request

Options:
  --request FILE            Slicing request JSON (required)
  --config FILE             Analysis configuration file
  --output DIR, -o          Output directory (default: ./out)
  --jobs N, -j N            Number of parsing workers (default: auto)
  --language NAME           Source language (only Cpp)
  --max-query-num N         Oracle attempts per query (default: 30)
  --model NAME              Model name passed to the oracle command
  --temperature T           Temperature passed to the oracle command
  --call-depth N            Maximum interprocedural hops (default: 3)
  --backward | --forward    Override the request's direction
  --oracle-command CMD      Shell command answering prompts on stdin
  --oracle-timeout SEC      Per-call timeout of the oracle command
  --prompt-dir DIR          Directory holding <direction>_slicer.json
  --schema-dir DIR          Path to schema directory
  --base-dir DIR            Base for relative paths in the request
  --log-level LEVEL         trace|debug|info|warn|error|off (default: info)
  --help, -h                Show this help

Output:
  <output>/slice_info_<slicing_request_id>.json
)");
}

void print_model_help()
{
    std::print(R"(Usage: reposlice model [options]

Build the program model and dump functions, APIs and the call graph

Options:
  --project DIR             Project root (required)
  --output FILE, -o         Output file (default: stdout)
  --config FILE             Analysis configuration file
  --jobs N, -j N            Number of parsing workers (default: auto)
  --schema-dir DIR          Path to schema directory
  --log-level LEVEL         trace|debug|info|warn|error|off (default: info)
  --help, -h                Show this help
)");
}

void print_judge_help()
{
    std::print(R"(Usage: reposlice judge [options]

Compare a slice report with <oracle-dir>/<request-id>.json

Options:
  --request-id ID           Slicing request id (required)
  --result FILE             Slice report to score (required)
  --oracle-dir DIR          Directory of reference slices (required)
  --output FILE, -o         Output file (default: stdout)
  --help, -h                Show this help
)");
}

struct SliceOptions
{
    std::string request;
    std::optional<std::string> config;
    std::string output;
    std::optional<int> jobs;
    std::optional<std::string> language;
    std::optional<int> max_query_num;
    std::optional<std::string> model_name;
    std::optional<double> temperature;
    std::optional<int> call_depth;
    std::optional<bool> is_backward;
    std::optional<std::string> oracle_command;
    std::optional<int> oracle_timeout;
    std::optional<std::string> prompt_dir;
    std::string schema_dir;
    std::string base_dir;
    std::string log_level;
    bool show_help;
};

struct ModelOptions
{
    std::string project;
    std::optional<std::string> output;
    std::optional<std::string> config;
    std::optional<int> jobs;
    std::string schema_dir;
    std::string log_level;
    bool show_help;
};

struct JudgeOptions
{
    std::string request_id;
    std::string result;
    std::string oracle_dir;
    std::optional<std::string> output;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> reposlice::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            reposlice::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

template <typename T>
[[nodiscard]] reposlice::Result<T> parse_number(std::string_view value, std::string_view option)
{
    T parsed{};
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (value.empty() || ec != std::errc{} || ptr != end) {
        return std::unexpected(reposlice::Error::make(
            "InvalidArgument",
            std::string("Invalid ") + std::string(option) + " value: " + std::string(value)));
    }
    return parsed;
}

template <typename T>
[[nodiscard]] reposlice::Result<bool> read_number_option(std::span<char*> args,
                                                         std::size_t idx,
                                                         std::string_view arg,
                                                         std::optional<T>& target,
                                                         bool& skip_next)
{
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    auto parsed = parse_number<T>(*value, arg);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    target = *parsed;
    skip_next = true;
    return reposlice::Result<bool>{true};
}

template <typename Target>
[[nodiscard]] reposlice::Result<bool> read_string_option(std::span<char*> args,
                                                         std::size_t idx,
                                                         std::string_view arg,
                                                         Target& target,
                                                         bool& skip_next)
{
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    target = std::move(*value);
    skip_next = true;
    return reposlice::Result<bool>{true};
}

[[nodiscard]] auto set_slice_oracle_option(std::string_view arg,
                                           std::span<char*> args,
                                           std::size_t idx,
                                           SliceOptions& options,
                                           bool& skip_next) -> reposlice::Result<bool>
{
    if (arg == "--max-query-num") {
        return read_number_option(args, idx, arg, options.max_query_num, skip_next);
    }
    if (arg == "--model") {
        return read_string_option(args, idx, arg, options.model_name, skip_next);
    }
    if (arg == "--temperature") {
        return read_number_option(args, idx, arg, options.temperature, skip_next);
    }
    if (arg == "--oracle-command") {
        return read_string_option(args, idx, arg, options.oracle_command, skip_next);
    }
    if (arg == "--oracle-timeout") {
        return read_number_option(args, idx, arg, options.oracle_timeout, skip_next);
    }
    if (arg == "--prompt-dir") {
        return read_string_option(args, idx, arg, options.prompt_dir, skip_next);
    }
    return reposlice::Result<bool>{false};
}

[[nodiscard]] auto set_slice_option(std::string_view arg,
                                    // CLI parsing signature is stable.
                                    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                    std::span<char*> args,
                                    std::size_t idx,
                                    SliceOptions& options,
                                    bool& skip_next) -> reposlice::Result<bool>
{
    if (arg == "--request") {
        return read_string_option(args, idx, arg, options.request, skip_next);
    }
    if (arg == "--config") {
        return read_string_option(args, idx, arg, options.config, skip_next);
    }
    if (arg == "--output" || arg == "-o") {
        return read_string_option(args, idx, arg, options.output, skip_next);
    }
    if (arg == "--jobs" || arg == "-j") {
        return read_number_option(args, idx, arg, options.jobs, skip_next);
    }
    if (arg == "--language") {
        return read_string_option(args, idx, arg, options.language, skip_next);
    }
    if (arg == "--call-depth") {
        return read_number_option(args, idx, arg, options.call_depth, skip_next);
    }
    if (arg == "--backward") {
        options.is_backward = true;
        return reposlice::Result<bool>{true};
    }
    if (arg == "--forward") {
        options.is_backward = false;
        return reposlice::Result<bool>{true};
    }
    if (arg == "--schema-dir") {
        return read_string_option(args, idx, arg, options.schema_dir, skip_next);
    }
    if (arg == "--base-dir") {
        return read_string_option(args, idx, arg, options.base_dir, skip_next);
    }
    if (arg == "--log-level") {
        return read_string_option(args, idx, arg, options.log_level, skip_next);
    }
    return set_slice_oracle_option(arg, args, idx, options, skip_next);
}

[[nodiscard]] reposlice::Result<SliceOptions> parse_slice_args(std::span<char*> args)
{
    SliceOptions options{.request = std::string{},
                         .config = std::nullopt,
                         .output = "./out",
                         .jobs = std::nullopt,
                         .language = std::nullopt,
                         .max_query_num = std::nullopt,
                         .model_name = std::nullopt,
                         .temperature = std::nullopt,
                         .call_depth = std::nullopt,
                         .is_backward = std::nullopt,
                         .oracle_command = std::nullopt,
                         .oracle_timeout = std::nullopt,
                         .prompt_dir = std::nullopt,
                         .schema_dir = REPOSLICE_SCHEMA_DIR,
                         .base_dir = std::string{},
                         .log_level = "info",
                         .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_slice_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                reposlice::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] reposlice::Result<ModelOptions> parse_model_args(std::span<char*> args)
{
    ModelOptions options{.project = std::string{},
                         .output = std::nullopt,
                         .config = std::nullopt,
                         .jobs = std::nullopt,
                         .schema_dir = REPOSLICE_SCHEMA_DIR,
                         .log_level = "info",
                         .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        reposlice::Result<bool> handled{false};
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--project") {
            handled = read_string_option(args, idx, arg, options.project, skip_next);
        } else if (arg == "--output" || arg == "-o") {
            handled = read_string_option(args, idx, arg, options.output, skip_next);
        } else if (arg == "--config") {
            handled = read_string_option(args, idx, arg, options.config, skip_next);
        } else if (arg == "--jobs" || arg == "-j") {
            handled = read_number_option(args, idx, arg, options.jobs, skip_next);
        } else if (arg == "--schema-dir") {
            handled = read_string_option(args, idx, arg, options.schema_dir, skip_next);
        } else if (arg == "--log-level") {
            handled = read_string_option(args, idx, arg, options.log_level, skip_next);
        }
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                reposlice::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] reposlice::Result<JudgeOptions> parse_judge_args(std::span<char*> args)
{
    JudgeOptions options{.request_id = std::string{},
                         .result = std::string{},
                         .oracle_dir = std::string{},
                         .output = std::nullopt,
                         .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        reposlice::Result<bool> handled{false};
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--request-id") {
            handled = read_string_option(args, idx, arg, options.request_id, skip_next);
        } else if (arg == "--result") {
            handled = read_string_option(args, idx, arg, options.result, skip_next);
        } else if (arg == "--oracle-dir") {
            handled = read_string_option(args, idx, arg, options.oracle_dir, skip_next);
        } else if (arg == "--output" || arg == "-o") {
            handled = read_string_option(args, idx, arg, options.output, skip_next);
        }
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                reposlice::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] reposlice::VoidResult setup_logging(std::string_view level_name)
{
    auto level = reposlice::log::parse_level(level_name);
    if (!level) {
        return std::unexpected(level.error());
    }
    reposlice::log::init_logging(*level);
    return {};
}

/// Defaults, then the config file, then command-line overrides.
[[nodiscard]] reposlice::Result<reposlice::io::AnalysisConfig> resolve_config(const SliceOptions& options)
{
    reposlice::io::AnalysisConfig config;
    if (options.config) {
        auto loaded = reposlice::io::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    config.language = options.language.value_or(config.language);
    config.jobs = options.jobs.value_or(config.jobs);
    config.call_depth = options.call_depth.value_or(config.call_depth);
    if (options.is_backward) {
        config.is_backward = options.is_backward;
    }
    config.oracle.max_query_num = options.max_query_num.value_or(config.oracle.max_query_num);
    config.oracle.model_name = options.model_name.value_or(config.oracle.model_name);
    config.oracle.temperature = options.temperature.value_or(config.oracle.temperature);
    config.oracle.command = options.oracle_command.value_or(config.oracle.command);
    config.oracle.timeout_seconds = options.oracle_timeout.value_or(config.oracle.timeout_seconds);
    config.oracle.prompt_dir = options.prompt_dir.value_or(config.oracle.prompt_dir);
    if (auto valid = reposlice::io::validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

/// A relative prompt directory that does not exist falls back to the installed prompts.
[[nodiscard]] std::string resolve_prompt_dir(const reposlice::io::AnalysisConfig& config)
{
    std::error_code ec;
    const std::filesystem::path dir(config.oracle.prompt_dir);
    if (dir.is_absolute() || std::filesystem::is_directory(dir, ec)) {
        return dir.string();
    }
    return (std::filesystem::path(REPOSLICE_PROMPT_DIR) / config.language).string();
}

[[nodiscard]] reposlice::Result<reposlice::frontend_clang::ModelBuildStats>
build_model(const std::string& project,
            const reposlice::io::AnalysisConfig& config,
            reposlice::model::ProgramModel& model)
{
    auto files = reposlice::frontend_clang::collect_source_files(project, config.frontend.extensions);
    if (!files) {
        return std::unexpected(files.error());
    }
    if (files->empty()) {
        REPOSLICE_LOG_WARN("No source files with a supported extension under {}", project);
    }
    reposlice::frontend_clang::ProgramModelBuilder builder(reposlice::frontend_clang::ModelBuildOptions{
        .project_root = project,
        .jobs = static_cast<unsigned>(config.jobs),
        .extra_args = config.frontend.extra_args,
        .resource_dir = REPOSLICE_CLANG_RESOURCE_DIR,
    });
    return builder.build(*files, model);
}

[[nodiscard]] int run_slice(const SliceOptions& options)
{
    if (auto logging = setup_logging(options.log_level); !logging) {
        std::println(stderr, "Error: {}", logging.error().message);
        return 1;
    }
    auto config = resolve_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }
    auto request = reposlice::io::load_request(options.request, options.schema_dir, options.base_dir);
    if (!request) {
        std::println(stderr, "Error: {}", request.error().message);
        return 1;
    }
    if (config->is_backward) {
        request->is_backward = *config->is_backward;
    }
    std::println("[slice] {}: {} `{}` at {}:{}",
                 request->slicing_request_id,
                 request->is_backward ? "backward from" : "forward from",
                 request->seed_name,
                 request->file_path,
                 request->seed_line_number);

    reposlice::model::ProgramModel model;
    auto stats = build_model(request->project_path, *config, model);
    if (!stats) {
        std::println(stderr, "Error: model build failed: {}", stats.error().message);
        return 1;
    }

    reposlice::oracle::CommandInferenceBackend backend(reposlice::oracle::CommandBackendOptions{
        .command = config->oracle.command,
        .model_name = config->oracle.model_name,
        .temperature = config->oracle.temperature,
        .timeout_seconds = config->oracle.timeout_seconds,
    });
    auto oracle = reposlice::oracle::PromptedSliceOracle::create(
        backend,
        reposlice::oracle::PromptedOracleOptions{.prompt_dir = resolve_prompt_dir(*config),
                                                 .max_query_num = config->oracle.max_query_num});
    if (!oracle) {
        std::println(stderr, "Error: {}", oracle.error().message);
        return 1;
    }

    reposlice::slicer::SliceDriver driver(model,
                                          **oracle,
                                          reposlice::slicer::SliceDriverOptions{.call_depth = config->call_depth});
    auto report = driver.run(*request);
    if (!report) {
        std::println(stderr, "Error: slicing failed: {}", report.error().message);
        return 1;
    }
    auto written = reposlice::io::write_report(*report, options.output, options.schema_dir);
    if (!written) {
        std::println(stderr, "Error: failed to write slice report: {}", written.error().message);
        return 1;
    }

    std::println("[slice] Wrote {}", reposlice::io::report_file_name(report->slicing_request_id));
    std::println("  files: {} parsed, {} dropped", stats->files_parsed, stats->files_dropped);
    std::println("  functions: {} ({} APIs)", stats->functions, stats->apis);
    std::println("  oracle: {} queries, {} backend calls, {} cache hits, {} dropped",
                 driver.stats().queries,
                 (*oracle)->backend_calls(),
                 (*oracle)->cache_hits(),
                 driver.stats().dropped);
    std::println("  relevant functions: {}", report->relevant_function_names_to_line_numbers.size());
    std::println("  output: {}", *written);
    return 0;
}

[[nodiscard]] int run_model(const ModelOptions& options)
{
    if (auto logging = setup_logging(options.log_level); !logging) {
        std::println(stderr, "Error: {}", logging.error().message);
        return 1;
    }
    reposlice::io::AnalysisConfig config;
    if (options.config) {
        auto loaded = reposlice::io::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            std::println(stderr, "Error: {}", loaded.error().message);
            return 1;
        }
        config = std::move(*loaded);
    }
    config.jobs = options.jobs.value_or(config.jobs);
    if (auto valid = reposlice::io::validate_config(config); !valid) {
        std::println(stderr, "Error: {}", valid.error().message);
        return 1;
    }

    reposlice::model::ProgramModel model;
    auto stats = build_model(options.project, config, model);
    if (!stats) {
        std::println(stderr, "Error: model build failed: {}", stats.error().message);
        return 1;
    }

    const std::string dump = model.to_json().dump(2) + "\n";
    if (!options.output) {
        std::print("{}", dump);
        return 0;
    }
    if (auto written = reposlice::common::write_text_file(*options.output, dump); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }
    std::println("[model] Wrote program model");
    std::println("  project: {}", options.project);
    std::println("  functions: {}", stats->functions);
    std::println("  apis: {}", stats->apis);
    std::println("  output: {}", *options.output);
    return 0;
}

[[nodiscard]] int run_judge(const JudgeOptions& options)
{
    auto judged = reposlice::judge::judge_files(options.request_id, options.result, options.oracle_dir);
    if (!judged) {
        std::println(stderr, "Error: {}", judged.error().message);
        return 1;
    }
    const std::string text = reposlice::judge::to_json(*judged).dump(2) + "\n";
    if (!options.output) {
        std::print("{}", text);
        return 0;
    }
    if (auto written = reposlice::common::write_text_file(*options.output, text); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }
    std::println("[judge] precision {:.3f}, recall {:.3f}, f1 {:.3f}",
                 judged->overall.precision(),
                 judged->overall.recall(),
                 judged->overall.f1_score());
    std::println("  output: {}", *options.output);
    return 0;
}

int cmd_slice(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_slice_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_slice_help();
        return 0;
    }
    if (options->request.empty()) {
        std::println(stderr, "Error: --request is required");
        print_slice_help();
        return 1;
    }
    return run_slice(*options);
}

int cmd_model(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_model_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_model_help();
        return 0;
    }
    if (options->project.empty()) {
        std::println(stderr, "Error: --project is required");
        print_model_help();
        return 1;
    }
    return run_model(*options);
}

int cmd_judge(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_judge_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_judge_help();
        return 0;
    }
    if (options->request_id.empty() || options->result.empty() || options->oracle_dir.empty()) {
        std::println(stderr, "Error: --request-id, --result and --oracle-dir are required");
        print_judge_help();
        return 1;
    }
    return run_judge(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "slice") {
            return cmd_slice(sub_argc, sub_argv);
        }
        if (cmd == "model") {
            return cmd_model(sub_argc, sub_argv);
        }
        if (cmd == "judge") {
            return cmd_judge(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
