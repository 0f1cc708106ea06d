/**
 * @file path.cpp
 * @brief Path normalization and containment checks
 */

#include "reposlice/common.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <vector>

namespace reposlice::common {

namespace {

[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> parts;
    for (auto part : path | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        if (!sv.empty()) {
            parts.emplace_back(sv);
        }
    }
    return parts;
}

[[nodiscard]] std::vector<std::string> resolve_parts(const std::vector<std::string>& parts,
                                                     bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
            } else if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

[[nodiscard]] std::string join_path(const std::vector<std::string>& parts)
{
    std::string result;
    for (const auto& [i, part] : std::views::enumerate(parts)) {
        if (i != 0) {
            result += '/';
        }
        result += part;
    }
    return result;
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    if (path.empty()) {
        return false;
    }
    if (path.front() == '/' || path.front() == '\\') {
        return true;
    }
    return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) != 0
           && path[1] == ':' && (path[2] == '/' || path[2] == '\\');
}

std::string normalize_path(std::string_view input, std::string_view repo_root)
{
    if (input.empty()) {
        return ".";
    }
    std::string path_str(input);
    std::ranges::replace(path_str, '\\', '/');
    const bool absolute_input = is_absolute_path(input);

    std::string normalized = join_path(resolve_parts(split_path(path_str), absolute_input));
    if (absolute_input && path_str.front() == '/') {
        normalized.insert(normalized.begin(), '/');
    }

    if (!repo_root.empty()) {
        const std::string norm_root = normalize_path(repo_root);
        if (is_within(normalized, norm_root)) {
            normalized = normalized.substr(norm_root.size());
            if (!normalized.empty() && normalized.front() == '/') {
                normalized.erase(0, 1);
            }
        }
    }

    return normalized.empty() ? "." : normalized;
}

bool is_within(std::string_view path, std::string_view root)
{
    const std::string norm_path = normalize_path(path);
    const std::string norm_root = normalize_path(root);
    if (norm_root == "/") {
        return norm_path.starts_with('/');
    }
    if (!norm_path.starts_with(norm_root)) {
        return false;
    }
    return norm_path.size() == norm_root.size() || norm_path[norm_root.size()] == '/';
}

std::string_view trim(std::string_view text)
{
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace reposlice::common
