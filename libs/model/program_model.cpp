/**
 * @file program_model.cpp
 * @brief Program model registries, call-graph maps and graph queries
 */

#include "reposlice/program_model.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <ranges>
#include <utility>

namespace reposlice::model {

namespace {

[[nodiscard]] std::set<int> targets_of(const std::map<CallSiteId, std::set<int>>& by_site)
{
    std::set<int> targets;
    for (const auto& ids : by_site | std::views::values) {
        targets.insert(ids.begin(), ids.end());
    }
    return targets;
}

[[nodiscard]] bool forward_has_edge(
    const std::map<FunctionId, std::map<CallSiteId, std::set<int>>>& forward,
    FunctionId caller,
    CallSiteId call_site,
    int target)
{
    auto caller_it = forward.find(caller);
    if (caller_it == forward.end()) {
        return false;
    }
    auto site_it = caller_it->second.find(call_site);
    return site_it != caller_it->second.end() && site_it->second.contains(target);
}

[[nodiscard]] bool reverse_has_edge(const std::map<int, std::set<CallEdge>>& reverse,
                                    int target,
                                    const CallEdge& edge)
{
    auto it = reverse.find(target);
    return it != reverse.end() && it->second.contains(edge);
}

[[nodiscard]] reposlice::Error inconsistency(std::string message)
{
    return Error::make("CallGraphInconsistent", std::move(message));
}

}  // namespace

ProgramModel::~ProgramModel() = default;

Function& ProgramModel::add_function(Function function)
{
    const FunctionId id = function.id();
    m_function_name_to_ids[function.name()].insert(id);
    m_function_to_file.insert_or_assign(id, function.file_path());
    auto it = m_functions.insert_or_assign(id, std::move(function)).first;
    return it->second;
}

void ProgramModel::remove_function(FunctionId id)
{
    auto it = m_functions.find(id);
    if (it == m_functions.end()) {
        return;
    }
    auto name_it = m_function_name_to_ids.find(it->second.name());
    if (name_it != m_function_name_to_ids.end()) {
        name_it->second.erase(id);
        if (name_it->second.empty()) {
            m_function_name_to_ids.erase(name_it);
        }
    }
    m_function_to_file.erase(id);
    m_functions.erase(it);
}

void ProgramModel::add_syntax_unit(std::unique_ptr<SyntaxUnit> unit)
{
    m_syntax_units.push_back(std::move(unit));
}

void ProgramModel::set_file_content(const std::string& path, std::string content)
{
    m_file_contents.insert_or_assign(path, std::move(content));
}

void ProgramModel::add_global(const std::string& name, std::string definition)
{
    m_globals.insert_or_assign(name, std::move(definition));
}

const Function* ProgramModel::function(FunctionId id) const
{
    auto it = m_functions.find(id);
    return it == m_functions.end() ? nullptr : &it->second;
}

Function* ProgramModel::mutable_function(FunctionId id)
{
    auto it = m_functions.find(id);
    return it == m_functions.end() ? nullptr : &it->second;
}

std::set<FunctionId> ProgramModel::function_ids_by_name(std::string_view name) const
{
    auto it = m_function_name_to_ids.find(name);
    if (it == m_function_name_to_ids.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> ProgramModel::file_of(FunctionId id) const
{
    auto it = m_function_to_file.find(id);
    if (it == m_function_to_file.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string* ProgramModel::file_content(const std::string& path) const
{
    auto it = m_file_contents.find(path);
    return it == m_file_contents.end() ? nullptr : &it->second;
}

ApiId ProgramModel::intern_api(std::string_view name, std::size_t parameter_count)
{
    std::lock_guard lock(m_api_mutex);
    for (const auto& api : m_apis | std::views::values) {
        if (api.name == name && api.parameter_count == parameter_count) {
            return api.id;
        }
    }
    const auto id = static_cast<ApiId>(m_apis.size());
    m_apis.emplace(id, Api{.id = id, .name = std::string(name), .parameter_count = parameter_count});
    return id;
}

void ProgramModel::add_function_edge(FunctionId caller, CallSiteId call_site, FunctionId callee)
{
    {
        std::lock_guard lock(m_caller_callee_mutex);
        m_caller_to_callees[caller][call_site].insert(callee);
    }
    {
        std::lock_guard lock(m_callee_caller_mutex);
        m_callee_to_callers[callee].insert(CallEdge{.call_site = call_site, .caller = caller});
    }
}

void ProgramModel::add_api_edge(FunctionId caller, CallSiteId call_site, ApiId api)
{
    {
        std::lock_guard lock(m_caller_api_mutex);
        m_caller_to_apis[caller][call_site].insert(api);
    }
    {
        std::lock_guard lock(m_api_caller_mutex);
        m_api_to_callers[api].insert(CallEdge{.call_site = call_site, .caller = caller});
    }
}

std::optional<Api> ProgramModel::api(ApiId id) const
{
    std::lock_guard lock(m_api_mutex);
    auto it = m_apis.find(id);
    if (it == m_apis.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Api> ProgramModel::apis() const
{
    std::lock_guard lock(m_api_mutex);
    auto values = m_apis | std::views::values;
    return {values.begin(), values.end()};
}

std::set<FunctionId> ProgramModel::callers_of(FunctionId callee) const
{
    std::set<FunctionId> callers;
    for (const auto& edge : call_edges_into(callee)) {
        callers.insert(edge.caller);
    }
    return callers;
}

std::set<CallEdge> ProgramModel::call_edges_into(FunctionId callee) const
{
    std::lock_guard lock(m_callee_caller_mutex);
    auto it = m_callee_to_callers.find(callee);
    if (it == m_callee_to_callers.end()) {
        return {};
    }
    return it->second;
}

std::set<FunctionId> ProgramModel::callees_of(FunctionId caller) const
{
    std::lock_guard lock(m_caller_callee_mutex);
    auto it = m_caller_to_callees.find(caller);
    if (it == m_caller_to_callees.end()) {
        return {};
    }
    return targets_of(it->second);
}

std::set<FunctionId> ProgramModel::callees_at(FunctionId caller, CallSiteId call_site) const
{
    std::lock_guard lock(m_caller_callee_mutex);
    auto it = m_caller_to_callees.find(caller);
    if (it == m_caller_to_callees.end()) {
        return {};
    }
    auto site_it = it->second.find(call_site);
    if (site_it == it->second.end()) {
        return {};
    }
    return site_it->second;
}

std::set<ApiId> ProgramModel::apis_called_by(FunctionId caller) const
{
    std::lock_guard lock(m_caller_api_mutex);
    auto it = m_caller_to_apis.find(caller);
    if (it == m_caller_to_apis.end()) {
        return {};
    }
    return targets_of(it->second);
}

std::set<CallEdge> ProgramModel::call_edges_into_api(ApiId api) const
{
    std::lock_guard lock(m_api_caller_mutex);
    auto it = m_api_to_callers.find(api);
    if (it == m_api_to_callers.end()) {
        return {};
    }
    return it->second;
}

std::vector<CallSite> ProgramModel::call_sites_by_callee_name(FunctionId caller,
                                                              std::string_view callee_name) const
{
    std::vector<CallSite> result;
    const Function* function = this->function(caller);
    if (function == nullptr) {
        return result;
    }
    for (const auto* sites : {&function->function_call_sites(), &function->api_call_sites()}) {
        for (const auto& site : *sites | std::views::values) {
            if (site.callee_name == callee_name) {
                result.push_back(site);
            }
        }
    }
    return result;
}

std::set<FunctionId> ProgramModel::transitive_callers(FunctionId id, int max_depth) const
{
    return transitive_closure(id, max_depth, /*upward=*/true);
}

std::set<FunctionId> ProgramModel::transitive_callees(FunctionId id, int max_depth) const
{
    return transitive_closure(id, max_depth, /*upward=*/false);
}

std::set<FunctionId> ProgramModel::transitive_closure(FunctionId id, int max_depth, bool upward) const
{
    std::set<FunctionId> reached;
    std::set<FunctionId> expanded{id};
    std::deque<std::pair<FunctionId, int>> worklist{{id, 0}};
    while (!worklist.empty()) {
        auto [current, depth] = worklist.front();
        worklist.pop_front();
        if (depth >= max_depth) {
            continue;
        }
        for (FunctionId next : upward ? callers_of(current) : callees_of(current)) {
            reached.insert(next);
            if (expanded.insert(next).second) {
                worklist.emplace_back(next, depth + 1);
            }
        }
    }
    return reached;
}

reposlice::VoidResult ProgramModel::check_consistency() const
{
    std::scoped_lock lock(m_api_mutex,
                          m_caller_callee_mutex,
                          m_callee_caller_mutex,
                          m_caller_api_mutex,
                          m_api_caller_mutex);

    const auto check_forward = [this](const ForwardMap& forward,
                                      const ReverseMap& reverse,
                                      bool targets_are_apis,
                                      std::string_view label) -> reposlice::VoidResult {
        for (const auto& [caller, by_site] : forward) {
            const Function* caller_fn = function(caller);
            if (caller_fn == nullptr) {
                return std::unexpected(
                    inconsistency(std::format("{} map names unknown caller {}", label, caller)));
            }
            const auto& resolved =
                targets_are_apis ? caller_fn->api_call_sites() : caller_fn->function_call_sites();
            for (const auto& [site, targets] : by_site) {
                auto resolved_it = resolved.find(site);
                auto all_it = caller_fn->call_sites().find(site);
                if (resolved_it == resolved.end() || all_it == caller_fn->call_sites().end()
                    || resolved_it->second != all_it->second) {
                    return std::unexpected(inconsistency(std::format(
                        "{} edge from {} at call site {} has no matching call-site record",
                        label,
                        caller,
                        site)));
                }
                for (int target : targets) {
                    const bool known = targets_are_apis ? m_apis.contains(target)
                                                        : m_functions.contains(target);
                    if (!known) {
                        return std::unexpected(inconsistency(
                            std::format("{} map names unknown target {}", label, target)));
                    }
                    if (!reverse_has_edge(reverse, target, CallEdge{.call_site = site, .caller = caller})) {
                        return std::unexpected(inconsistency(std::format(
                            "{} edge {} -> {} at call site {} has no reverse entry",
                            label,
                            caller,
                            target,
                            site)));
                    }
                }
            }
        }
        for (const auto& [target, edges] : reverse) {
            for (const auto& edge : edges) {
                if (!forward_has_edge(forward, edge.caller, edge.call_site, target)) {
                    return std::unexpected(inconsistency(std::format(
                        "{} reverse entry {} <- {} at call site {} has no forward edge",
                        label,
                        target,
                        edge.caller,
                        edge.call_site)));
                }
            }
        }
        return {};
    };

    if (auto result = check_forward(m_caller_to_callees, m_callee_to_callers, false, "function");
        !result) {
        return result;
    }
    return check_forward(m_caller_to_apis, m_api_to_callers, true, "api");
}

nlohmann::json ProgramModel::to_json() const
{
    nlohmann::json functions = nlohmann::json::array();
    for (const auto& function : m_functions | std::views::values) {
        nlohmann::json entry = function;
        nlohmann::json callees = nlohmann::json::array();
        for (FunctionId callee : callees_of(function.id())) {
            callees.push_back(callee);
        }
        entry["callees"] = std::move(callees);
        entry["called_apis"] = apis_called_by(function.id());
        functions.push_back(std::move(entry));
    }
    nlohmann::json files = nlohmann::json::array();
    for (const auto& path : m_file_contents | std::views::keys) {
        files.push_back(path);
    }
    return nlohmann::json{
        {"functions", std::move(functions)},
        {"apis", apis()},
        {"globals", m_globals},
        {"files", std::move(files)},
    };
}

}  // namespace reposlice::model
