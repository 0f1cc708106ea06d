#pragma once

/**
 * @file function_extractor.hpp
 * @brief Per-function extraction of values, call sites and control-flow scopes
 */

#include "syntax_index.hpp"

#include "reposlice/common.hpp"
#include "reposlice/function.hpp"

#include <functional>
#include <set>
#include <string>

namespace reposlice::frontend_clang {

/// Names of function-like macros defined anywhere in the project.
using MacroNameSet = std::set<std::string, std::less<>>;

/**
 * @brief Fills one Function from its FunctionDecl.
 *
 * Touches only the Function passed to build() and reads the ParsedFile, so
 * instances may run in parallel over distinct functions of the same file.
 */
class FunctionModelBuilder
{
public:
    FunctionModelBuilder(const ParsedFile& file, const MacroNameSet& macro_names);

    /**
     * Extract parameters, returns, call sites (with arguments and outputs) and
     * if/loop scopes into @p function.
     *
     * @return AnalysisError when the function has no usable body
     */
    [[nodiscard]] reposlice::VoidResult build(model::Function& function) const;

private:
    const ParsedFile& m_file;
    const MacroNameSet& m_macro_names;
};

}  // namespace reposlice::frontend_clang
