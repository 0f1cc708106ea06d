/**
 * @file model_builder.cpp
 * @brief Three-phase parallel model construction over an LLVM thread pool
 */

#include "reposlice/model_builder.hpp"

#include "function_extractor.hpp"
#include "syntax_index.hpp"

#include "reposlice/call_graph.hpp"
#include "reposlice/log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <future>
#include <map>
#include <optional>
#include <ranges>
#include <set>
#include <utility>

#include <clang/AST/Decl.h>
#include <llvm/Config/llvm-config.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>

namespace reposlice::frontend_clang {

namespace {

#if LLVM_VERSION_MAJOR >= 19
using WorkerPool = llvm::DefaultThreadPool;
#else
using WorkerPool = llvm::ThreadPool;
#endif

/// Run @p task(i) for every i in [0, count) on @p pool and wait for all of them.
template <typename Task>
void fan_out(WorkerPool& pool, std::size_t count, Task task)
{
    std::vector<std::shared_future<void>> futures;
    futures.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        futures.emplace_back(pool.async([&task, i]() { task(i); }));
    }
    for (auto& future : futures) {
        future.get();
    }
}

[[nodiscard]] std::string extension_of(const std::string& path)
{
    return std::filesystem::path(path).extension().string();
}

[[nodiscard]] bool is_cxx_file(const std::string& path)
{
    const std::string ext = extension_of(path);
    return ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".hpp" || ext == ".hh" || ext == ".hxx";
}

void add_macro(const MacroRecord& macro,
               const std::string& path,
               model::FunctionId id,
               model::ProgramModel& model)
{
    if (!macro.is_function_like) {
        model.add_global(macro.name, macro.replacement);
        return;
    }
    model.add_global(macro.name, macro.definition);

    model::Function& function = model.add_function(model::Function(model::FunctionInit{
        .id = id,
        .name = macro.name,
        .code = macro.definition,
        .start_line = macro.start_line,
        .end_line = macro.end_line,
        .file_path = path,
        .decl = nullptr,
        .is_macro = true,
        .parameter_count = macro.parameters.size() - (macro.is_variadic && !macro.parameters.empty() ? 1U : 0U),
    }));
    for (auto [index, parameter] : std::views::enumerate(macro.parameters)) {
        const bool is_rest = macro.is_variadic && index + 1 == std::ssize(macro.parameters);
        function.add_parameter(model::Value(model::ValueInit{
            .name = parameter,
            .label = is_rest ? model::ValueLabel::kVariPara : model::ValueLabel::kPara,
            .file_path = path,
            .line_in_file = macro.start_line,
            .function_id = id,
            .function_name = macro.name,
            .line_in_function = 1,
            .index = static_cast<int>(index),
            .comment = std::nullopt,
        }));
    }
}

}  // namespace

ProgramModelBuilder::ProgramModelBuilder(ModelBuildOptions options)
    : m_options(std::move(options))
{}

reposlice::Result<ModelBuildStats> ProgramModelBuilder::build(const std::vector<std::string>& files,
                                                              model::ProgramModel& model) const
{
    ModelBuildStats stats;
    std::vector<std::string> sorted_files = files;
    std::ranges::sort(sorted_files);

    WorkerPool pool(llvm::hardware_concurrency(m_options.jobs));
    const SyntaxIndex index(SyntaxIndexOptions{
        .project_root = m_options.project_root,
        .extra_args = m_options.extra_args,
        .resource_dir = m_options.resource_dir,
        .c_header_dirs = c_header_directories(sorted_files),
    });

    // Phase 1: parse files. Every task owns its slot.
    REPOSLICE_LOG_INFO("Parsing {} file(s)", sorted_files.size());
    std::vector<reposlice::Result<FileSyntax>> parsed(sorted_files.size());
    fan_out(pool, sorted_files.size(), [&](std::size_t i) { parsed[i] = index.index_file(sorted_files[i]); });

    // Ids are minted here, in sorted file order then source order.
    model::FunctionId next_id = 0;
    MacroNameSet macro_names;
    std::map<const ParsedFile*, std::vector<model::FunctionId>> functions_by_file;
    for (auto [i, slot] : std::views::enumerate(parsed)) {
        const std::string& path = sorted_files[static_cast<std::size_t>(i)];
        if (!slot) {
            REPOSLICE_LOG_WARN("Dropping {}: {}", path, slot.error().message);
            ++stats.files_dropped;
            continue;
        }
        FileSyntax& syntax = *slot;
        const ParsedFile* file = syntax.file.get();
        auto& ids = functions_by_file[file];
        for (const auto& record : syntax.functions) {
            const model::FunctionId id = next_id++;
            model.add_function(model::Function(model::FunctionInit{
                .id = id,
                .name = record.name,
                .code = record.code,
                .start_line = record.start_line,
                .end_line = record.end_line,
                .file_path = path,
                .decl = record.decl,
                .is_macro = false,
                .parameter_count = record.decl != nullptr
                                       ? std::optional<std::size_t>(record.decl->getNumParams())
                                       : std::nullopt,
            }));
            ids.push_back(id);
        }
        for (const auto& macro : syntax.macros) {
            if (macro.is_function_like) {
                macro_names.insert(macro.name);
                add_macro(macro, path, next_id++, model);
                ++stats.macros;
            } else {
                add_macro(macro, path, -1, model);
            }
        }
        model.set_file_content(path, file->content());
        model.add_syntax_unit(std::move(syntax.file));
        ++stats.files_parsed;
    }

    // Phase 2: per-function extraction. A SourceManager caches line lookups
    // without locking, so functions of one file are handled by one task.
    REPOSLICE_LOG_INFO("Extracting {} function(s)", next_id);
    std::vector<std::pair<const ParsedFile*, std::vector<model::FunctionId>>> batches(
        functions_by_file.begin(), functions_by_file.end());
    std::vector<std::vector<std::pair<model::FunctionId, Error>>> failures(batches.size());
    fan_out(pool, batches.size(), [&](std::size_t i) {
        const auto& [file, ids] = batches[i];
        const FunctionModelBuilder builder(*file, macro_names);
        for (model::FunctionId id : ids) {
            model::Function* function = model.mutable_function(id);
            if (function == nullptr) {
                continue;
            }
            if (auto built = builder.build(*function); !built) {
                failures[i].emplace_back(id, built.error());
            }
        }
    });
    for (const auto& [id, error] : failures | std::views::join) {
        REPOSLICE_LOG_WARN("Dropping function {}: {}", id, error.message);
        model.remove_function(id);
        ++stats.functions_dropped;
    }

    // Phase 3: call-graph resolution. Tasks contend only on the model's guarded maps.
    std::vector<model::FunctionId> function_ids;
    for (const auto& function : model.functions() | std::views::values) {
        if (!function.is_macro()) {
            function_ids.push_back(function.id());
        }
    }
    REPOSLICE_LOG_INFO("Resolving call sites of {} function(s)", function_ids.size());
    const callgraph::CallGraphResolver resolver(model);
    std::vector<reposlice::VoidResult> resolved(function_ids.size());
    fan_out(pool, function_ids.size(), [&](std::size_t i) {
        model::Function* function = model.mutable_function(function_ids[i]);
        if (function != nullptr) {
            resolved[i] = resolver.resolve(*function);
        }
    });
    for (const auto& result : resolved) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    if (auto consistent = model.check_consistency(); !consistent) {
        return std::unexpected(consistent.error());
    }

    stats.functions = model.functions().size();
    stats.apis = model.apis().size();
    REPOSLICE_LOG_INFO("Model ready: {} file(s), {} function(s), {} API(s)",
                       stats.files_parsed,
                       stats.functions,
                       stats.apis);
    return stats;
}

reposlice::Result<std::vector<std::string>> collect_source_files(const std::string& root,
                                                                 const std::vector<std::string>& extensions)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return std::unexpected(Error::make("IOError", "Project directory not found: " + root));
    }
    const std::filesystem::path absolute_root = std::filesystem::absolute(root, ec);
    if (ec) {
        return std::unexpected(Error::make("IOError", std::format("Cannot resolve {}: {}", root, ec.message())));
    }

    std::vector<std::string> files;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(absolute_root, options, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string ext = it->path().extension().string();
        if (ext.size() < 2) {
            continue;
        }
        ext.erase(0, 1);
        std::ranges::transform(ext, ext.begin(), [](unsigned char c) noexcept {
            return static_cast<char>(std::tolower(c));
        });
        if (std::ranges::find(extensions, ext) != extensions.end()) {
            files.push_back(common::normalize_path(it->path().string()));
        }
    }
    if (ec) {
        return std::unexpected(Error::make("IOError", std::format("Failed to scan {}: {}", root, ec.message())));
    }
    std::ranges::sort(files);
    return files;
}

std::set<std::string> c_header_directories(const std::vector<std::string>& files)
{
    struct DirectoryLanguages
    {
        bool has_c = false;
        bool has_cxx = false;
    };
    std::map<std::string, DirectoryLanguages> directories;
    bool project_has_cxx = false;
    for (const auto& file : files) {
        auto& langs = directories[std::filesystem::path(file).parent_path().string()];
        if (extension_of(file) == ".c") {
            langs.has_c = true;
        } else if (is_cxx_file(file)) {
            langs.has_cxx = true;
            project_has_cxx = true;
        }
    }

    std::set<std::string> c_dirs;
    for (const auto& [dir, langs] : directories) {
        if (langs.has_cxx) {
            continue;
        }
        if (langs.has_c || !project_has_cxx) {
            c_dirs.insert(dir);
        }
    }
    return c_dirs;
}

}  // namespace reposlice::frontend_clang
