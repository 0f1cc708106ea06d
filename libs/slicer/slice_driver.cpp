/**
 * @file slice_driver.cpp
 * @brief Worklist traversal and the four frontier expansion rules
 */

#include "reposlice/slice_driver.hpp"

#include "reposlice/log.hpp"

#include <deque>
#include <format>
#include <utility>

namespace reposlice::slicer {

void SliceAccumulator::merge(const std::string& function_name, std::span<const int> lines)
{
    m_lines[function_name].insert(lines.begin(), lines.end());
}

SliceDriver::SliceDriver(const model::ProgramModel& model, oracle::SliceOracle& oracle, SliceDriverOptions options)
    : m_model(model)
    , m_oracle(oracle)
    , m_options(options)
{}

reposlice::Result<std::optional<model::FunctionId>>
SliceDriver::find_seed_function(const io::SliceRequest& request) const
{
    std::vector<model::FunctionId> matches;
    for (const auto& [id, function] : m_model.functions()) {
        if (function.is_macro() || function.file_path() != request.file_path) {
            continue;
        }
        if (function.start_line() <= request.seed_line_number && request.seed_line_number <= function.end_line()) {
            matches.push_back(id);
        }
    }
    if (matches.empty()) {
        return std::optional<model::FunctionId>{};
    }
    if (matches.size() > 1) {
        std::string names;
        for (model::FunctionId id : matches) {
            if (!names.empty()) {
                names += ", ";
            }
            names += m_model.function(id)->name();
        }
        return std::unexpected(Error::make("SeedError",
                                           std::format("{} functions contain seed line {} of {}: {}",
                                                       matches.size(),
                                                       request.seed_line_number,
                                                       request.file_path,
                                                       names)));
    }
    return std::optional<model::FunctionId>{matches.front()};
}

reposlice::Result<io::SliceReport> SliceDriver::run(const io::SliceRequest& request)
{
    m_stats = {};
    io::SliceReport report{.slicing_request_id = request.slicing_request_id,
                           .relevant_function_names_to_line_numbers = {}};

    auto seed_id = find_seed_function(request);
    if (!seed_id) {
        return std::unexpected(seed_id.error());
    }
    if (!seed_id->has_value()) {
        REPOSLICE_LOG_WARN("No function of {} contains seed line {}; the slice is empty",
                           request.file_path,
                           request.seed_line_number);
        return report;
    }

    const model::Function& seed_function = *m_model.function(**seed_id);
    model::Value seed(model::ValueInit{
        .name = request.seed_name,
        .label = model::ValueLabel::kSrc,
        .file_path = request.file_path,
        .line_in_file = request.seed_line_number,
        .function_id = seed_function.id(),
        .function_name = seed_function.name(),
        .line_in_function = seed_function.to_function_line(request.seed_line_number),
        .index = -1,
        .comment = std::nullopt,
    });
    REPOSLICE_LOG_INFO("Slicing {} {} from {}",
                       request.is_backward ? "backward" : "forward",
                       seed_function.name(),
                       seed.description());

    SliceAccumulator accumulator;
    std::set<oracle::SliceQueryKey> processed;
    std::deque<WorkItem> queue;
    queue.push_back(WorkItem{.function_id = seed_function.id(), .values = {std::move(seed)}, .hops = 0});

    while (!queue.empty()) {
        WorkItem item = std::move(queue.front());
        queue.pop_front();

        const model::Function* function = m_model.function(item.function_id);
        if (function == nullptr) {
            continue;
        }
        auto query = oracle::SliceQuery::make(*function, std::move(item.values), request.is_backward);
        if (!query) {
            return std::unexpected(query.error());
        }
        if (!processed.insert(query->key()).second) {
            ++m_stats.skipped;
            continue;
        }

        ++m_stats.queries;
        auto result = m_oracle.invoke(*query);
        if (!result) {
            ++m_stats.dropped;
            REPOSLICE_LOG_WARN("No slice for {} from {}", function->name(), query->seed_description());
            continue;
        }
        accumulator.merge(function->name(), result->lines);

        if (item.hops >= m_options.call_depth) {
            REPOSLICE_LOG_DEBUG("Call depth {} reached at {}", m_options.call_depth, function->name());
            continue;
        }
        std::vector<WorkItem> next;
        for (const auto& external : result->external_values) {
            expand(*function, external, request.is_backward, item.hops + 1, next);
        }
        m_stats.hops += next.size();
        for (auto& work : next) {
            queue.push_back(std::move(work));
        }
    }

    report.relevant_function_names_to_line_numbers = accumulator.lines();
    REPOSLICE_LOG_INFO("Slice touches {} function(s) after {} oracle quer{} ({} dropped)",
                       accumulator.lines().size(),
                       m_stats.queries,
                       m_stats.queries == 1 ? "y" : "ies",
                       m_stats.dropped);
    return report;
}

void SliceDriver::expand(const model::Function& function,
                         const oracle::ExternalValue& external,
                         bool is_backward,
                         int hops,
                         std::vector<WorkItem>& next) const
{
    using oracle::ExternalValueKind;

    if (is_backward) {
        if (external.kind == ExternalValueKind::kParameter && external.index) {
            expand_parameter(function, *external.index, hops, next);
        } else if (external.kind == ExternalValueKind::kOutputValue && external.callee_name && external.line) {
            expand_output_value(function, *external.callee_name, *external.line, hops, next);
        }
        return;
    }
    if (external.kind == ExternalValueKind::kArgument && external.callee_name && external.index && external.line) {
        expand_argument(function, *external.callee_name, *external.index, *external.line, hops, next);
    } else if (external.kind == ExternalValueKind::kReturnValue) {
        expand_return_value(function, hops, next);
    }
}

void SliceDriver::expand_parameter(const model::Function& function,
                                   int index,
                                   int hops,
                                   std::vector<WorkItem>& next) const
{
    for (const auto& edge : m_model.call_edges_into(function.id())) {
        const model::Function* caller = m_model.function(edge.caller);
        if (caller == nullptr) {
            continue;
        }
        auto site = caller->call_sites().find(edge.call_site);
        if (site == caller->call_sites().end() || site->second.callee_name != function.name()) {
            continue;
        }
        for (auto& argument : caller->arguments(
                 {.call_site = edge.call_site, .index = index, .label = model::ValueLabel::kArg})) {
            REPOSLICE_LOG_DEBUG("{} parameter {} <- {}", function.name(), index, argument.description());
            next.push_back(WorkItem{.function_id = caller->id(), .values = {std::move(argument)}, .hops = hops});
        }
    }
}

void SliceDriver::expand_output_value(const model::Function& function,
                                      const std::string& callee_name,
                                      int line,
                                      int hops,
                                      std::vector<WorkItem>& next) const
{
    for (model::CallSiteId site : function.call_sites_at(line, callee_name)) {
        for (model::FunctionId callee_id : m_model.callees_at(function.id(), site)) {
            const model::Function* callee = m_model.function(callee_id);
            if (callee == nullptr || callee->return_values().empty()) {
                continue;
            }
            std::vector<model::Value> returns(callee->return_values().begin(), callee->return_values().end());
            REPOSLICE_LOG_DEBUG("{} line {} <- {} return value(s) of {}",
                                function.name(),
                                line,
                                returns.size(),
                                callee->name());
            next.push_back(WorkItem{.function_id = callee_id, .values = std::move(returns), .hops = hops});
        }
    }
}

void SliceDriver::expand_argument(const model::Function& function,
                                  const std::string& callee_name,
                                  int index,
                                  int line,
                                  int hops,
                                  std::vector<WorkItem>& next) const
{
    for (model::CallSiteId site : function.call_sites_at(line, callee_name)) {
        for (model::FunctionId callee_id : m_model.callees_at(function.id(), site)) {
            const model::Function* callee = m_model.function(callee_id);
            if (callee == nullptr) {
                continue;
            }
            auto parameter = callee->parameter_at(index);
            if (!parameter) {
                REPOSLICE_LOG_DEBUG("{} has no parameter at index {}", callee->name(), index);
                continue;
            }
            next.push_back(WorkItem{.function_id = callee_id, .values = {std::move(*parameter)}, .hops = hops});
        }
    }
}

void SliceDriver::expand_return_value(const model::Function& function, int hops, std::vector<WorkItem>& next) const
{
    for (const auto& edge : m_model.call_edges_into(function.id())) {
        const model::Function* caller = m_model.function(edge.caller);
        if (caller == nullptr) {
            continue;
        }
        auto output = caller->output_value(edge.call_site);
        if (!output) {
            continue;
        }
        next.push_back(WorkItem{.function_id = caller->id(), .values = {std::move(*output)}, .hops = hops});
    }
}

}  // namespace reposlice::slicer
