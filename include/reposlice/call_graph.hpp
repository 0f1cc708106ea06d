#pragma once

/**
 * @file call_graph.hpp
 * @brief Call-site resolution against user functions and library APIs
 */

#include "reposlice/common.hpp"
#include "reposlice/program_model.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace reposlice::callgraph {

/**
 * Textual callee name of a C/C++ call: text before the first '(', without a
 * trailing template argument list, after the last '.', '->' or '::'.
 *
 * @code
 * callee_name_from_text("obj->ns::run<int>")  // "run"
 * @endcode
 */
[[nodiscard]] std::string callee_name_from_text(std::string_view callee_text);

/**
 * @brief Resolves one caller's call sites into call-graph edges.
 *
 * resolve() may run concurrently for different callers on the same model; it
 * mutates only the caller's own Function and the model's guarded maps.
 */
class CallGraphResolver
{
public:
    explicit CallGraphResolver(model::ProgramModel& model);

    [[nodiscard]] reposlice::VoidResult resolve(model::Function& caller) const;

    /**
     * User functions named like the call site's callee that accept its
     * receiver shape and argument count.
     */
    [[nodiscard]] std::vector<model::FunctionId> match_candidates(const model::Function& caller,
                                                                  const model::CallSite& site) const;

private:
    model::ProgramModel& m_model;
};

}  // namespace reposlice::callgraph
