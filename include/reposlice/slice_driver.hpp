#pragma once

/**
 * @file slice_driver.hpp
 * @brief Interprocedural slicing worklist over a built ProgramModel
 */

#include "reposlice/common.hpp"
#include "reposlice/program_model.hpp"
#include "reposlice/slice_oracle.hpp"
#include "reposlice/slice_report.hpp"
#include "reposlice/slice_request.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace reposlice::slicer {

/// Union of in-slice lines per function name. Merging is idempotent.
class SliceAccumulator
{
public:
    void merge(const std::string& function_name, std::span<const int> lines);

    [[nodiscard]] const std::map<std::string, std::set<int>>& lines() const { return m_lines; }
    [[nodiscard]] bool empty() const { return m_lines.empty(); }

private:
    std::map<std::string, std::set<int>> m_lines;
};

struct SliceDriverOptions
{
    int call_depth = 3;  ///< interprocedural hops allowed from the seed function
};

struct SliceDriverStats
{
    std::size_t queries = 0;
    std::size_t dropped = 0;  ///< oracle gave no usable answer
    std::size_t skipped = 0;  ///< already processed
    std::size_t hops = 0;     ///< items enqueued across a function boundary
};

/**
 * @brief One slicing run.
 *
 * The driver only reads the model. Work items are (function, seed values,
 * hop count); an item whose (function, values) pair was already processed
 * is skipped, so cycles in the call graph cost at most one oracle query per
 * distinct pair.
 */
class SliceDriver
{
public:
    SliceDriver(const model::ProgramModel& model, oracle::SliceOracle& oracle, SliceDriverOptions options);

    /**
     * Locate the seed function of @p request: the only non-macro function of
     * request.file_path whose line span contains the seed line.
     *
     * @return std::nullopt if no function matches, SeedError if several do
     */
    [[nodiscard]] reposlice::Result<std::optional<model::FunctionId>>
    find_seed_function(const io::SliceRequest& request) const;

    /**
     * Slice from the request's seed in the request's direction. A missing
     * seed function yields an empty report; an invalid seed class handed to
     * the oracle is fatal.
     */
    [[nodiscard]] reposlice::Result<io::SliceReport> run(const io::SliceRequest& request);

    [[nodiscard]] const SliceDriverStats& stats() const { return m_stats; }

private:
    struct WorkItem
    {
        model::FunctionId function_id = -1;
        std::vector<model::Value> values;
        int hops = 0;
    };

    void expand(const model::Function& function,
                const oracle::ExternalValue& external,
                bool is_backward,
                int hops,
                std::vector<WorkItem>& next) const;
    void expand_parameter(const model::Function& function, int index, int hops, std::vector<WorkItem>& next) const;
    void expand_output_value(const model::Function& function,
                             const std::string& callee_name,
                             int line,
                             int hops,
                             std::vector<WorkItem>& next) const;
    void expand_argument(const model::Function& function,
                         const std::string& callee_name,
                         int index,
                         int line,
                         int hops,
                         std::vector<WorkItem>& next) const;
    void expand_return_value(const model::Function& function, int hops, std::vector<WorkItem>& next) const;

    const model::ProgramModel& m_model;
    oracle::SliceOracle& m_oracle;
    SliceDriverOptions m_options;
    SliceDriverStats m_stats;
};

}  // namespace reposlice::slicer
