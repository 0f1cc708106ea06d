/**
 * @file function.cpp
 * @brief Function model queries and builder-side mutators
 */

#include "reposlice/function.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace reposlice::model {

namespace {

[[nodiscard]] bool argument_matches(const Value& value,
                                    const CallSite& site,
                                    const ArgumentFilter& filter)
{
    if (filter.call_site && *filter.call_site != site.id) {
        return false;
    }
    if (filter.line_in_function
        && (*filter.line_in_function < site.start_line || *filter.line_in_function > site.end_line)) {
        return false;
    }
    if (filter.callee_name && *filter.callee_name != site.callee_name) {
        return false;
    }
    if (filter.index && *filter.index != value.index()) {
        return false;
    }
    return !filter.label || *filter.label == value.label();
}

[[nodiscard]] reposlice::VoidResult copy_call_site(const std::map<CallSiteId, CallSite>& all,
                                                   std::map<CallSiteId, CallSite>& resolved,
                                                   CallSiteId call_site)
{
    auto it = all.find(call_site);
    if (it == all.end()) {
        return std::unexpected(Error::make(
            "AnalysisError", std::format("Call site {} is not registered in this function", call_site)));
    }
    resolved.insert_or_assign(call_site, it->second);
    return {};
}

void append_span(nlohmann::json& j, const LineSpan& span)
{
    j = nlohmann::json::array({span.start, span.end});
}

}  // namespace

std::string render_lined_code(std::string_view code)
{
    std::string lined;
    int line_number = 1;
    for (auto line : code | std::views::split('\n')) {
        if (line_number > 1) {
            lined += '\n';
        }
        lined += std::format("{}. {}", line_number, std::string_view(line.begin(), line.end()));
        ++line_number;
    }
    return lined;
}

Function::Function(FunctionInit init)
    : m_id(init.id)
    , m_name(std::move(init.name))
    , m_code(std::move(init.code))
    , m_lined_code(render_lined_code(m_code))
    , m_start_line(init.start_line)
    , m_end_line(init.end_line)
    , m_file_path(std::move(init.file_path))
    , m_decl(init.decl)
    , m_is_macro(init.is_macro)
    , m_parameter_count(init.parameter_count)
{}

std::vector<Value> Function::arguments(const ArgumentFilter& filter) const
{
    std::vector<Value> result;
    for (const auto& [site_id, values] : m_arguments) {
        auto site = m_call_sites.find(site_id);
        if (site == m_call_sites.end()) {
            continue;
        }
        for (const auto& value : values) {
            if (argument_matches(value, site->second, filter)) {
                result.push_back(value);
            }
        }
    }
    return result;
}

std::optional<Value> Function::output_value(CallSiteId call_site) const
{
    auto it = m_output_values.find(call_site);
    if (it == m_output_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CallSiteId> Function::call_sites_at(int line_in_function,
                                                std::string_view callee_name) const
{
    std::vector<CallSiteId> result;
    for (const auto& [id, site] : m_call_sites) {
        if (site.callee_name == callee_name && site.start_line <= line_in_function
            && line_in_function <= site.end_line) {
            result.push_back(id);
        }
    }
    return result;
}

std::optional<Value> Function::parameter_at(int index) const
{
    auto it = std::ranges::find_if(m_parameters, [index](const Value& para) {
        return para.label() == ValueLabel::kPara && para.index() == index;
    });
    if (it != m_parameters.end()) {
        return *it;
    }
    if (index >= static_cast<int>(fixed_arity())) {
        auto variadic = std::ranges::find(m_parameters, ValueLabel::kVariPara, &Value::label);
        if (variadic != m_parameters.end()) {
            return *variadic;
        }
    }
    return std::nullopt;
}

std::size_t Function::fixed_arity() const
{
    if (m_parameter_count) {
        return *m_parameter_count;
    }
    // Without a declared count, unnamed parameters before a named one still occupy an index.
    int max_index = -1;
    for (const auto& para : m_parameters) {
        if (para.label() == ValueLabel::kPara) {
            max_index = std::max(max_index, para.index());
        }
        if (para.label() == ValueLabel::kVariPara) {
            max_index = std::max(max_index, para.index() - 1);
        }
    }
    return static_cast<std::size_t>(max_index + 1);
}

bool Function::is_variadic() const
{
    return std::ranges::any_of(m_parameters,
                               [](const Value& para) { return para.label() == ValueLabel::kVariPara; });
}

bool Function::has_receiver_parameter() const
{
    return std::ranges::any_of(m_parameters,
                               [](const Value& para) { return para.label() == ValueLabel::kObjPara; });
}

std::size_t Function::argument_count(CallSiteId call_site) const
{
    auto it = m_arguments.find(call_site);
    if (it == m_arguments.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::ranges::count(it->second, ValueLabel::kArg, &Value::label));
}

bool Function::has_receiver_argument(CallSiteId call_site) const
{
    auto it = m_arguments.find(call_site);
    return it != m_arguments.end()
           && std::ranges::any_of(it->second, [](const Value& arg) {
                  return arg.label() == ValueLabel::kObjArg;
              });
}

void Function::add_parameter(Value value)
{
    m_parameters.insert(std::move(value));
}

void Function::add_return_value(Value value)
{
    m_return_values.insert(std::move(value));
}

void Function::add_call_site(CallSite call_site)
{
    const CallSiteId id = call_site.id;
    m_call_sites.insert_or_assign(id, std::move(call_site));
}

void Function::add_argument(CallSiteId call_site, Value value)
{
    m_arguments[call_site].insert(std::move(value));
}

void Function::set_output_value(CallSiteId call_site, Value value)
{
    m_output_values.insert_or_assign(call_site, std::move(value));
}

void Function::add_if_scope(LineSpan span, IfScope scope)
{
    m_if_scopes.insert_or_assign(span, std::move(scope));
}

void Function::add_loop_scope(LineSpan span, LoopScope scope)
{
    m_loop_scopes.insert_or_assign(span, std::move(scope));
}

reposlice::VoidResult Function::mark_function_call_site(CallSiteId call_site)
{
    return copy_call_site(m_call_sites, m_function_call_sites, call_site);
}

reposlice::VoidResult Function::mark_api_call_site(CallSiteId call_site)
{
    return copy_call_site(m_call_sites, m_api_call_sites, call_site);
}

void to_json(nlohmann::json& j, const Function& function)
{
    const auto sites_to_json = [](const std::map<CallSiteId, CallSite>& sites) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& site : sites | std::views::values) {
            out.push_back({
                {"id", site.id},
                {"callee_name", site.callee_name},
                {"start_line", site.start_line},
                {"end_line", site.end_line},
                {"text", site.text},
            });
        }
        return out;
    };

    nlohmann::json if_scopes = nlohmann::json::array();
    for (const auto& [span, scope] : function.if_scopes()) {
        nlohmann::json entry = {{"condition_text", scope.condition_text}};
        append_span(entry["span"], span);
        append_span(entry["condition"], scope.condition);
        append_span(entry["true_branch"], scope.true_branch);
        append_span(entry["else_branch"], scope.else_branch);
        if_scopes.push_back(std::move(entry));
    }
    nlohmann::json loop_scopes = nlohmann::json::array();
    for (const auto& [span, scope] : function.loop_scopes()) {
        nlohmann::json entry = {{"header_text", scope.header_text}};
        append_span(entry["span"], span);
        append_span(entry["header"], scope.header);
        append_span(entry["body"], scope.body);
        loop_scopes.push_back(std::move(entry));
    }

    j = nlohmann::json{
        {"id", function.id()},
        {"name", function.name()},
        {"file_path", function.file_path()},
        {"start_line", function.start_line()},
        {"end_line", function.end_line()},
        {"is_macro", function.is_macro()},
        {"parameters", function.parameters()},
        {"return_values", function.return_values()},
        {"arguments", function.arguments()},
        {"call_sites", sites_to_json(function.call_sites())},
        {"function_call_sites", sites_to_json(function.function_call_sites())},
        {"api_call_sites", sites_to_json(function.api_call_sites())},
        {"if_scopes", std::move(if_scopes)},
        {"loop_scopes", std::move(loop_scopes)},
    };
}

}  // namespace reposlice::model
