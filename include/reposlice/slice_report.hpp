#pragma once

/**
 * @file slice_report.hpp
 * @brief Slice report: function name to in-slice relative line numbers
 */

#include "reposlice/common.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace reposlice::io {

struct SliceReport
{
    std::string slicing_request_id;
    std::map<std::string, std::set<int>> relevant_function_names_to_line_numbers;
};

[[nodiscard]] nlohmann::json to_json(const SliceReport& report);

/// File name of a report: "slice_info_<id>.json".
[[nodiscard]] std::string report_file_name(std::string_view slicing_request_id);

/**
 * Validate @p report against slice_report.v1.schema.json and write it to
 * "<output_dir>/slice_info_<id>.json".
 *
 * @return Path of the written file
 */
[[nodiscard]] reposlice::Result<std::string> write_report(const SliceReport& report,
                                                          const std::string& output_dir,
                                                          std::string_view schema_dir);

}  // namespace reposlice::io
