#pragma once

/**
 * @file model_builder.hpp
 * @brief Concurrent construction of a ProgramModel from C/C++ sources
 *
 * Three fan-out/fan-in phases share one worker pool:
 *   1. parse every file and collect raw function and macro records,
 *   2. extract parameters, returns, call sites and scopes per function,
 *   3. resolve call sites into call-graph edges per function.
 * Each phase joins before the next one starts.
 */

#include "reposlice/common.hpp"
#include "reposlice/program_model.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace reposlice::frontend_clang {

struct ModelBuildOptions
{
    std::string project_root;
    unsigned jobs = 0;  ///< 0 = all hardware threads
    std::vector<std::string> extra_args;
    std::string resource_dir;
};

struct ModelBuildStats
{
    std::size_t files_parsed = 0;
    std::size_t files_dropped = 0;
    std::size_t functions = 0;
    std::size_t functions_dropped = 0;
    std::size_t macros = 0;
    std::size_t apis = 0;
};

class ProgramModelBuilder
{
public:
    explicit ProgramModelBuilder(ModelBuildOptions options);

    /**
     * Populate @p model from @p files (absolute paths).
     *
     * Files that fail to parse and functions whose extraction fails are
     * dropped with a warning; only resolver invariant violations are errors.
     */
    [[nodiscard]] reposlice::Result<ModelBuildStats> build(const std::vector<std::string>& files,
                                                           model::ProgramModel& model) const;

private:
    ModelBuildOptions m_options;
};

/**
 * Regular files below @p root whose extension (without the dot) is one of
 * @p extensions, sorted.
 */
[[nodiscard]] reposlice::Result<std::vector<std::string>>
collect_source_files(const std::string& root, const std::vector<std::string>& extensions);

/**
 * Directories of @p files whose ".h" headers belong to C code: those with a
 * ".c" source and no C++ source, and header-only directories when the whole
 * file list holds no C++ source.
 */
[[nodiscard]] std::set<std::string> c_header_directories(const std::vector<std::string>& files);

}  // namespace reposlice::frontend_clang
