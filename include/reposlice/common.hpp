#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, path normalization
 */

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace reposlice {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace reposlice

namespace reposlice::common {

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 * - Optionally make relative to repo_root
 *
 * @param input Input path
 * @param repo_root Optional repository root for relative paths
 * @return Normalized path
 */
[[nodiscard]] std::string normalize_path(std::string_view input, std::string_view repo_root = "");

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Check whether @p path names @p root itself or an entry below it.
 * Both sides are normalized first; no filesystem access.
 */
[[nodiscard]] bool is_within(std::string_view path, std::string_view root);

// ============================================================================
// Text helpers
// ============================================================================

/**
 * Strip leading and trailing ASCII whitespace
 */
[[nodiscard]] std::string_view trim(std::string_view text);

/**
 * Read a whole file as bytes
 */
[[nodiscard]] reposlice::Result<std::string> read_text_file(const std::string& path);

/**
 * Write @p content to @p path, creating parent directories
 */
[[nodiscard]] reposlice::VoidResult write_text_file(const std::string& path, std::string_view content);

// ============================================================================
// Hashing
// ============================================================================

/**
 * Fold @p value into @p seed (boost::hash_combine mixing)
 */
inline void hash_combine(std::size_t& seed, std::size_t value) noexcept
{
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
}

}  // namespace reposlice::common
