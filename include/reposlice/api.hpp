#pragma once

/**
 * @file api.hpp
 * @brief Library API stub: a callee with no user-defined body
 */

#include <cstddef>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace reposlice::model {

using ApiId = int;

/**
 * @brief Callee that did not resolve to any user function.
 *
 * Identity is (name, parameter count); the id is only a registry handle, so two
 * call sites with the same name and arity always share one Api.
 */
struct Api
{
    ApiId id = -1;
    std::string name;
    std::size_t parameter_count = 0;

    friend bool operator==(const Api& lhs, const Api& rhs)
    {
        return lhs.name == rhs.name && lhs.parameter_count == rhs.parameter_count;
    }
};

struct ApiHash
{
    [[nodiscard]] std::size_t operator()(const Api& api) const noexcept
    {
        return std::hash<std::string>{}(api.name) ^ (std::hash<std::size_t>{}(api.parameter_count) << 1U);
    }
};

inline void to_json(nlohmann::json& j, const Api& api)
{
    j = nlohmann::json{
        {"id", api.id},
        {"name", api.name},
        {"parameter_count", api.parameter_count},
    };
}

}  // namespace reposlice::model
