#pragma once

/**
 * @file slice_oracle.hpp
 * @brief Contract of the intra-procedural slice oracle
 *
 * An oracle answers one question: given a function, one equivalence class of
 * seed values and a direction, which lines of the function belong to the
 * slice and where does the slice leave the function.
 */

#include "reposlice/common.hpp"
#include "reposlice/function.hpp"
#include "reposlice/value.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace reposlice::oracle {

enum class ExternalValueKind {
    kParameter,
    kArgument,
    kReturnValue,
    kOutputValue,
};

[[nodiscard]] std::string_view to_string(ExternalValueKind kind);

/// Where a per-function slice crosses the function boundary.
struct ExternalValue
{
    ExternalValueKind kind = ExternalValueKind::kParameter;
    std::optional<std::string> callee_name;
    std::optional<int> index;
    std::optional<int> line;  ///< function-relative
    std::optional<std::string> variable_name;
    std::optional<std::string> field_name;

    friend bool operator==(const ExternalValue&, const ExternalValue&) = default;
};

struct SliceResult
{
    std::string slice;
    std::vector<int> lines;  ///< function-relative
    std::vector<ExternalValue> external_values;
};

/// Structural cache key of a query.
struct SliceQueryKey
{
    model::FunctionId function_id = -1;
    std::vector<model::Value> seeds;
    bool is_backward = true;

    friend bool operator==(const SliceQueryKey&, const SliceQueryKey&) = default;
    friend auto operator<=>(const SliceQueryKey&, const SliceQueryKey&) = default;
};

/**
 * Whether @p seeds form one accepted equivalence class: all return values,
 * several values sharing file, line and label, or a single value.
 */
[[nodiscard]] bool is_valid_seed_class(std::span<const model::Value> seeds);

class SliceQuery
{
public:
    /**
     * Build a query. Seeds are deduplicated and ordered by (index, name).
     *
     * @return OracleContractError if the seeds are not one equivalence class
     */
    [[nodiscard]] static reposlice::Result<SliceQuery> make(const model::Function& function,
                                                            std::vector<model::Value> seeds,
                                                            bool is_backward);

    [[nodiscard]] const model::Function& function() const { return *m_function; }
    [[nodiscard]] const std::vector<model::Value>& seeds() const { return m_seeds; }
    [[nodiscard]] bool is_backward() const { return m_is_backward; }
    [[nodiscard]] SliceQueryKey key() const;

    /// Prompt text naming the seeds, e.g. "the return value `r` at line 6 ...".
    [[nodiscard]] std::string seed_description() const;

private:
    SliceQuery(const model::Function& function, std::vector<model::Value> seeds, bool is_backward);

    const model::Function* m_function;
    std::vector<model::Value> m_seeds;
    bool m_is_backward;
};

/**
 * @brief The oracle boundary used by the slice driver.
 *
 * std::nullopt means "no usable answer" (backend failure, timeout, exhausted
 * retries) and is never fatal.
 */
class SliceOracle
{
public:
    virtual ~SliceOracle() = default;
    [[nodiscard]] virtual std::optional<SliceResult> invoke(const SliceQuery& query) = 0;
};

}  // namespace reposlice::oracle
