/**
 * @file report.cpp
 * @brief Slice report serialization
 */

#include "reposlice/slice_report.hpp"

#include "reposlice/schema_validate.hpp"
#include "reposlice/version.hpp"

#include <filesystem>
#include <format>

namespace reposlice::io {

nlohmann::json to_json(const SliceReport& report)
{
    nlohmann::json functions = nlohmann::json::object();
    for (const auto& [name, lines] : report.relevant_function_names_to_line_numbers) {
        functions[name] = lines;
    }
    return nlohmann::json{
        {"slicing_request_id", report.slicing_request_id},
        {"relevant_function_names_to_line_numbers", std::move(functions)},
    };
}

std::string report_file_name(std::string_view slicing_request_id)
{
    return std::format("slice_info_{}.json", slicing_request_id);
}

reposlice::Result<std::string> write_report(const SliceReport& report,
                                            const std::string& output_dir,
                                            std::string_view schema_dir)
{
    const nlohmann::json j = to_json(report);
    if (auto valid = common::validate_json_named(j, schema_dir, kReportSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    const std::string path =
        (std::filesystem::path(output_dir) / report_file_name(report.slicing_request_id)).string();
    if (auto written = common::write_text_file(path, j.dump(4) + "\n"); !written) {
        return std::unexpected(written.error());
    }
    return path;
}

}  // namespace reposlice::io
