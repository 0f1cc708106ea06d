#pragma once

/**
 * @file slice_request.hpp
 * @brief Slicing request: seed location, seed name and direction
 */

#include "reposlice/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace reposlice::io {

struct SliceRequest
{
    std::string slicing_request_id;
    std::string project_path;  ///< normalized absolute path once validated
    std::string file_path;     ///< normalized absolute path once validated
    int seed_line_number = 0;  ///< 1-based file line
    std::string seed_name;
    bool is_backward = true;
};

/**
 * Check a request: the project directory and seed file exist, the file lies
 * inside the project, the line is positive and the name is non-empty.
 * Relative paths are resolved against @p base_dir and both paths are
 * normalized in the returned copy.
 *
 * @return RequestError naming the first failed check
 */
[[nodiscard]] reposlice::Result<SliceRequest> validate_request(SliceRequest request,
                                                               std::string_view base_dir);

/**
 * Build a request from its JSON form, after validating against
 * slice_request.v1.schema.json in @p schema_dir.
 */
[[nodiscard]] reposlice::Result<SliceRequest> request_from_json(const nlohmann::json& j,
                                                                std::string_view schema_dir,
                                                                std::string_view base_dir);

/// Read, schema-check and validate a request file.
[[nodiscard]] reposlice::Result<SliceRequest> load_request(const std::string& path,
                                                           std::string_view schema_dir,
                                                           std::string_view base_dir);

[[nodiscard]] nlohmann::json to_json(const SliceRequest& request);

}  // namespace reposlice::io
