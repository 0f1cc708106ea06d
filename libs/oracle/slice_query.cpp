/**
 * @file slice_query.cpp
 * @brief Seed equivalence classes and oracle query construction
 */

#include "reposlice/slice_oracle.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <set>
#include <tuple>
#include <utility>

namespace reposlice::oracle {

std::string_view to_string(ExternalValueKind kind)
{
    switch (kind) {
        case ExternalValueKind::kParameter:
            return "Parameter";
        case ExternalValueKind::kArgument:
            return "Argument";
        case ExternalValueKind::kReturnValue:
            return "Return Value";
        case ExternalValueKind::kOutputValue:
            return "Output Value";
    }
    return "Unknown";
}

bool is_valid_seed_class(std::span<const model::Value> seeds)
{
    if (seeds.empty()) {
        return false;
    }
    const std::set<model::Value> distinct(seeds.begin(), seeds.end());
    if (distinct.size() == 1) {
        return true;
    }
    const bool all_returns = std::ranges::all_of(
        seeds, [](const model::Value& seed) { return seed.label() == model::ValueLabel::kRet; });
    if (all_returns) {
        return true;
    }
    const model::Value& first = seeds.front();
    return std::ranges::all_of(seeds, [&first](const model::Value& seed) {
        return seed.file_path() == first.file_path() && seed.line_in_file() == first.line_in_file()
               && seed.label() == first.label();
    });
}

SliceQuery::SliceQuery(const model::Function& function, std::vector<model::Value> seeds, bool is_backward)
    : m_function(&function)
    , m_seeds(std::move(seeds))
    , m_is_backward(is_backward)
{}

reposlice::Result<SliceQuery> SliceQuery::make(const model::Function& function,
                                              std::vector<model::Value> seeds,
                                              bool is_backward)
{
    if (!is_valid_seed_class(seeds)) {
        return std::unexpected(Error::make(
            "OracleContractError",
            std::format("{} seed value(s) for {} do not form one equivalence class", seeds.size(), function.name())));
    }
    std::ranges::sort(seeds);
    const auto [first, last] = std::ranges::unique(seeds);
    seeds.erase(first, last);
    std::ranges::stable_sort(seeds, [](const model::Value& lhs, const model::Value& rhs) {
        return std::forward_as_tuple(lhs.index(), lhs.name()) < std::forward_as_tuple(rhs.index(), rhs.name());
    });
    return SliceQuery(function, std::move(seeds), is_backward);
}

SliceQueryKey SliceQuery::key() const
{
    return SliceQueryKey{.function_id = m_function->id(), .seeds = m_seeds, .is_backward = m_is_backward};
}

std::string SliceQuery::seed_description() const
{
    std::string description;
    for (const auto& [i, seed] : std::views::enumerate(m_seeds)) {
        if (i > 0) {
            description += "; ";
        }
        description += seed.description();
    }
    return description;
}

}  // namespace reposlice::oracle
