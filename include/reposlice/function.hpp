#pragma once

/**
 * @file function.hpp
 * @brief User-defined function model: values, call sites, control-flow scopes
 */

#include "reposlice/common.hpp"
#include "reposlice/value.hpp"

#include <compare>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace clang {
class FunctionDecl;
}  // namespace clang

namespace reposlice::model {

using CallSiteId = int;

/// Inclusive line range; {0, 0} marks an absent span.
struct LineSpan
{
    int start = 0;
    int end = 0;

    [[nodiscard]] bool is_empty() const { return start == 0 && end == 0; }
    [[nodiscard]] bool contains(int line) const { return start <= line && line <= end; }

    friend bool operator==(const LineSpan&, const LineSpan&) = default;
    friend auto operator<=>(const LineSpan&, const LineSpan&) = default;
};

/// One textual invocation inside a function body. Lines are function-relative.
struct CallSite
{
    CallSiteId id = 0;
    std::string callee_text;
    std::string callee_name;
    int start_line = 0;
    int end_line = 0;
    std::string text;

    friend bool operator==(const CallSite&, const CallSite&) = default;
};

/// Lines are absolute file lines.
struct IfScope
{
    LineSpan condition;
    std::string condition_text;
    LineSpan true_branch;
    LineSpan else_branch;
};

/// Lines are absolute file lines.
struct LoopScope
{
    LineSpan header;
    std::string header_text;
    LineSpan body;
};

/// Optional constraints for Function::arguments(); unset fields match anything.
struct ArgumentFilter
{
    std::optional<CallSiteId> call_site;
    std::optional<int> line_in_function;
    std::optional<std::string> callee_name;
    std::optional<int> index;
    std::optional<ValueLabel> label;
};

struct FunctionInit
{
    FunctionId id = -1;
    std::string name;
    std::string code;
    int start_line = 0;
    int end_line = 0;
    std::string file_path;
    const clang::FunctionDecl* decl = nullptr;
    bool is_macro = false;
    /// Declared positional parameters, named or not, excluding "..." and the receiver.
    std::optional<std::size_t> parameter_count;
};

class Function
{
public:
    explicit Function(FunctionInit init);

    [[nodiscard]] FunctionId id() const { return m_id; }
    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] const std::string& code() const { return m_code; }
    [[nodiscard]] const std::string& lined_code() const { return m_lined_code; }
    [[nodiscard]] int start_line() const { return m_start_line; }
    [[nodiscard]] int end_line() const { return m_end_line; }
    [[nodiscard]] const std::string& file_path() const { return m_file_path; }
    [[nodiscard]] const clang::FunctionDecl* decl() const { return m_decl; }
    [[nodiscard]] bool is_macro() const { return m_is_macro; }

    [[nodiscard]] const std::set<Value>& parameters() const { return m_parameters; }
    [[nodiscard]] const std::set<Value>& return_values() const { return m_return_values; }
    [[nodiscard]] const std::map<CallSiteId, CallSite>& call_sites() const { return m_call_sites; }
    [[nodiscard]] const std::map<CallSiteId, CallSite>& function_call_sites() const
    {
        return m_function_call_sites;
    }
    [[nodiscard]] const std::map<CallSiteId, CallSite>& api_call_sites() const
    {
        return m_api_call_sites;
    }
    [[nodiscard]] const std::map<LineSpan, IfScope>& if_scopes() const { return m_if_scopes; }
    [[nodiscard]] const std::map<LineSpan, LoopScope>& loop_scopes() const { return m_loop_scopes; }

    /// Arguments across all call sites that satisfy every set field of @p filter.
    [[nodiscard]] std::vector<Value> arguments(const ArgumentFilter& filter = {}) const;
    [[nodiscard]] std::optional<Value> output_value(CallSiteId call_site) const;

    /// Call sites naming @p callee_name whose line range covers @p line_in_function.
    [[nodiscard]] std::vector<CallSiteId> call_sites_at(int line_in_function,
                                                        std::string_view callee_name) const;

    [[nodiscard]] std::optional<Value> parameter_at(int index) const;
    [[nodiscard]] std::size_t fixed_arity() const;
    [[nodiscard]] bool is_variadic() const;
    [[nodiscard]] bool has_receiver_parameter() const;

    /// Number of positional arguments written at @p call_site.
    [[nodiscard]] std::size_t argument_count(CallSiteId call_site) const;
    [[nodiscard]] bool has_receiver_argument(CallSiteId call_site) const;

    [[nodiscard]] int to_function_line(int file_line) const { return file_line - m_start_line + 1; }
    [[nodiscard]] int to_file_line(int function_line) const { return function_line + m_start_line - 1; }

    // Mutators used while the model is being built.
    void add_parameter(Value value);
    void add_return_value(Value value);
    void add_call_site(CallSite call_site);
    void add_argument(CallSiteId call_site, Value value);
    void set_output_value(CallSiteId call_site, Value value);
    void add_if_scope(LineSpan span, IfScope scope);
    void add_loop_scope(LineSpan span, LoopScope scope);

    /// Copy an entry of call_sites() into the resolved-to-function map.
    [[nodiscard]] reposlice::VoidResult mark_function_call_site(CallSiteId call_site);
    /// Copy an entry of call_sites() into the resolved-to-API map.
    [[nodiscard]] reposlice::VoidResult mark_api_call_site(CallSiteId call_site);

private:
    FunctionId m_id;
    std::string m_name;
    std::string m_code;
    std::string m_lined_code;
    int m_start_line;
    int m_end_line;
    std::string m_file_path;
    const clang::FunctionDecl* m_decl;
    bool m_is_macro;
    std::optional<std::size_t> m_parameter_count;

    std::set<Value> m_parameters;
    std::set<Value> m_return_values;
    std::map<CallSiteId, std::set<Value>> m_arguments;
    std::map<CallSiteId, Value> m_output_values;

    std::map<CallSiteId, CallSite> m_call_sites;
    std::map<CallSiteId, CallSite> m_function_call_sites;
    std::map<CallSiteId, CallSite> m_api_call_sites;

    std::map<LineSpan, IfScope> m_if_scopes;
    std::map<LineSpan, LoopScope> m_loop_scopes;
};

/// Prefix every line of @p code with its 1-based number ("1. ...").
[[nodiscard]] std::string render_lined_code(std::string_view code);

void to_json(nlohmann::json& j, const Function& function);

}  // namespace reposlice::model
