/**
 * @file call_graph.cpp
 * @brief Name, receiver and arity based call-site resolution
 */

#include "reposlice/call_graph.hpp"

#include "reposlice/log.hpp"

#include <algorithm>
#include <array>

namespace reposlice::callgraph {

namespace {

/// Drop a trailing "<...>" (with nesting) from @p text.
[[nodiscard]] std::string_view strip_template_arguments(std::string_view text)
{
    if (!text.ends_with('>')) {
        return text;
    }
    int depth = 0;
    for (std::size_t i = text.size(); i > 0; --i) {
        const char c = text[i - 1];
        if (c == '>') {
            ++depth;
        } else if (c == '<') {
            --depth;
            if (depth == 0) {
                return common::trim(text.substr(0, i - 1));
            }
        }
    }
    return text;
}

[[nodiscard]] bool arity_accepts(const model::Function& callee, std::size_t argument_count)
{
    if (callee.is_variadic()) {
        return callee.fixed_arity() <= argument_count;
    }
    return callee.fixed_arity() == argument_count;
}

}  // namespace

std::string callee_name_from_text(std::string_view callee_text)
{
    const std::string_view trimmed = common::trim(callee_text);
    std::string_view name = trimmed;
    if (auto paren = name.find('('); paren != std::string_view::npos) {
        name = common::trim(name.substr(0, paren));
    }
    name = strip_template_arguments(name);

    std::size_t cut = 0;
    for (std::string_view separator : std::array<std::string_view, 3>{".", "->", "::"}) {
        if (auto pos = name.rfind(separator); pos != std::string_view::npos) {
            cut = std::max(cut, pos + separator.size());
        }
    }
    name = common::trim(name.substr(cut));
    return std::string(name.empty() ? trimmed : name);
}

CallGraphResolver::CallGraphResolver(model::ProgramModel& model)
    : m_model(model)
{}

std::vector<model::FunctionId> CallGraphResolver::match_candidates(const model::Function& caller,
                                                                   const model::CallSite& site) const
{
    std::vector<model::FunctionId> matched;
    const std::size_t argument_count = caller.argument_count(site.id);
    const bool has_receiver = caller.has_receiver_argument(site.id);
    for (model::FunctionId id : m_model.function_ids_by_name(site.callee_name)) {
        const model::Function* candidate = m_model.function(id);
        if (candidate == nullptr) {
            continue;
        }
        if (candidate->has_receiver_parameter() != has_receiver) {
            continue;
        }
        if (arity_accepts(*candidate, argument_count)) {
            matched.push_back(id);
        }
    }
    return matched;
}

reposlice::VoidResult CallGraphResolver::resolve(model::Function& caller) const
{
    for (const auto& [site_id, site] : caller.call_sites()) {
        const auto candidates = match_candidates(caller, site);
        if (!candidates.empty()) {
            if (auto marked = caller.mark_function_call_site(site_id); !marked) {
                return marked;
            }
            for (model::FunctionId callee : candidates) {
                m_model.add_function_edge(caller.id(), site_id, callee);
            }
            continue;
        }

        const model::ApiId api = m_model.intern_api(site.callee_name, caller.argument_count(site_id));
        if (auto marked = caller.mark_api_call_site(site_id); !marked) {
            return marked;
        }
        m_model.add_api_edge(caller.id(), site_id, api);
        REPOSLICE_LOG_TRACE("{}: call site {} ({}) resolved to API {}",
                            caller.name(),
                            site_id,
                            site.callee_name,
                            api);
    }
    return {};
}

}  // namespace reposlice::callgraph
