#pragma once

/**
 * @file program_model.hpp
 * @brief Shared store of functions, APIs and the bidirectional call graph
 *
 * The model is populated by ProgramModelBuilder in three fan-out/fan-in
 * phases and is read-only afterwards. The API registry and each of the four
 * call-graph maps has its own mutex, so per-function resolver tasks contend
 * only on the structure they are inserting into.
 */

#include "reposlice/api.hpp"
#include "reposlice/common.hpp"
#include "reposlice/function.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace reposlice::model {

/// One (call site, caller) pair of a reverse call-graph map.
struct CallEdge
{
    CallSiteId call_site = 0;
    FunctionId caller = -1;

    friend bool operator==(const CallEdge&, const CallEdge&) = default;
    friend auto operator<=>(const CallEdge&, const CallEdge&) = default;
};

/**
 * @brief Parsed per-file syntax kept alive for the model's lifetime.
 *
 * Function::decl() points into one of these; the concrete type belongs to
 * the frontend.
 */
class SyntaxUnit
{
public:
    virtual ~SyntaxUnit() = default;
    [[nodiscard]] virtual const std::string& path() const = 0;
};

class ProgramModel
{
public:
    ProgramModel() = default;
    ~ProgramModel();
    ProgramModel(const ProgramModel&) = delete;
    ProgramModel& operator=(const ProgramModel&) = delete;

    // ------------------------------------------------------------------
    // Registries (written only between parallel phases)
    // ------------------------------------------------------------------

    Function& add_function(Function function);
    void remove_function(FunctionId id);
    void add_syntax_unit(std::unique_ptr<SyntaxUnit> unit);
    void set_file_content(const std::string& path, std::string content);
    void add_global(const std::string& name, std::string definition);

    [[nodiscard]] const Function* function(FunctionId id) const;
    [[nodiscard]] Function* mutable_function(FunctionId id);
    [[nodiscard]] const std::map<FunctionId, Function>& functions() const { return m_functions; }
    [[nodiscard]] std::set<FunctionId> function_ids_by_name(std::string_view name) const;
    [[nodiscard]] std::optional<std::string> file_of(FunctionId id) const;
    [[nodiscard]] const std::string* file_content(const std::string& path) const;
    [[nodiscard]] const std::map<std::string, std::string>& globals() const { return m_globals; }
    [[nodiscard]] std::size_t syntax_unit_count() const { return m_syntax_units.size(); }

    // ------------------------------------------------------------------
    // API registry and call-graph edges (safe to call concurrently)
    // ------------------------------------------------------------------

    /**
     * Return the id of the API with this (name, parameter count), registering
     * it first if needed. Search and insert happen under one lock.
     */
    [[nodiscard]] ApiId intern_api(std::string_view name, std::size_t parameter_count);
    void add_function_edge(FunctionId caller, CallSiteId call_site, FunctionId callee);
    void add_api_edge(FunctionId caller, CallSiteId call_site, ApiId api);

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    [[nodiscard]] std::optional<Api> api(ApiId id) const;
    [[nodiscard]] std::vector<Api> apis() const;

    [[nodiscard]] std::set<FunctionId> callers_of(FunctionId callee) const;
    [[nodiscard]] std::set<CallEdge> call_edges_into(FunctionId callee) const;
    [[nodiscard]] std::set<FunctionId> callees_of(FunctionId caller) const;
    [[nodiscard]] std::set<FunctionId> callees_at(FunctionId caller, CallSiteId call_site) const;
    [[nodiscard]] std::set<ApiId> apis_called_by(FunctionId caller) const;
    [[nodiscard]] std::set<CallEdge> call_edges_into_api(ApiId api) const;

    /// Function and API call sites of @p caller whose callee name is @p callee_name.
    [[nodiscard]] std::vector<CallSite> call_sites_by_callee_name(FunctionId caller,
                                                                  std::string_view callee_name) const;

    /// All callers reachable within @p max_depth reverse edges. Cycles are fine.
    [[nodiscard]] std::set<FunctionId> transitive_callers(FunctionId id, int max_depth) const;
    /// All callees reachable within @p max_depth forward edges. Cycles are fine.
    [[nodiscard]] std::set<FunctionId> transitive_callees(FunctionId id, int max_depth) const;

    /**
     * Check the call-graph invariants: every id in a map is registered, every
     * reverse entry mirrors a forward entry (and vice versa), and resolved
     * call sites are also present in the caller's full call-site map.
     */
    [[nodiscard]] reposlice::VoidResult check_consistency() const;

    [[nodiscard]] nlohmann::json to_json() const;

private:
    using ForwardMap = std::map<FunctionId, std::map<CallSiteId, std::set<int>>>;
    using ReverseMap = std::map<int, std::set<CallEdge>>;

    [[nodiscard]] std::set<FunctionId> transitive_closure(FunctionId id, int max_depth, bool upward) const;

    std::map<FunctionId, Function> m_functions;
    std::map<std::string, std::set<FunctionId>, std::less<>> m_function_name_to_ids;
    std::map<FunctionId, std::string> m_function_to_file;
    std::map<std::string, std::string> m_file_contents;
    std::map<std::string, std::string> m_globals;
    std::vector<std::unique_ptr<SyntaxUnit>> m_syntax_units;

    mutable std::mutex m_api_mutex;
    std::map<ApiId, Api> m_apis;

    mutable std::mutex m_caller_callee_mutex;
    ForwardMap m_caller_to_callees;
    mutable std::mutex m_callee_caller_mutex;
    ReverseMap m_callee_to_callers;
    mutable std::mutex m_caller_api_mutex;
    ForwardMap m_caller_to_apis;
    mutable std::mutex m_api_caller_mutex;
    ReverseMap m_api_to_callers;
};

}  // namespace reposlice::model
