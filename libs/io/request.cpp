/**
 * @file request.cpp
 * @brief Slice request parsing and validation
 */

#include "reposlice/slice_request.hpp"

#include "reposlice/schema_validate.hpp"
#include "reposlice/version.hpp"

#include <filesystem>
#include <format>
#include <system_error>
#include <utility>

namespace reposlice::io {

namespace {

[[nodiscard]] reposlice::Error request_error(std::string message)
{
    return Error::make("RequestError", std::move(message));
}

/// Absolute, symlink-resolved, normalized form of @p path.
[[nodiscard]] std::string resolve_path(std::string_view path, std::string_view base_dir)
{
    std::filesystem::path resolved(path);
    if (resolved.is_relative()) {
        const std::filesystem::path base =
            base_dir.empty() ? std::filesystem::current_path() : std::filesystem::path(base_dir);
        resolved = base / resolved;
    }
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(resolved, ec);
    if (!ec) {
        resolved = std::move(canonical);
    }
    return common::normalize_path(resolved.string());
}

}  // namespace

reposlice::Result<SliceRequest> validate_request(SliceRequest request, std::string_view base_dir)
{
    request.project_path = std::string(common::trim(request.project_path));
    request.file_path = std::string(common::trim(request.file_path));
    request.seed_name = std::string(common::trim(request.seed_name));

    if (request.project_path.empty()) {
        return std::unexpected(request_error("project_path must be a non-empty string"));
    }
    request.project_path = resolve_path(request.project_path, base_dir);
    std::error_code ec;
    if (!std::filesystem::is_directory(request.project_path, ec)) {
        return std::unexpected(request_error("project_path does not exist: " + request.project_path));
    }

    if (request.file_path.empty()) {
        return std::unexpected(request_error("file_path must be a non-empty string"));
    }
    request.file_path = resolve_path(request.file_path, base_dir);
    if (!std::filesystem::is_regular_file(request.file_path, ec)) {
        return std::unexpected(request_error("file_path does not exist: " + request.file_path));
    }
    if (!common::is_within(request.file_path, request.project_path)) {
        return std::unexpected(request_error(
            std::format("file_path {} must be inside project_path {}", request.file_path, request.project_path)));
    }

    if (request.seed_line_number < 1) {
        return std::unexpected(request_error(
            std::format("seed_line_number must be a positive integer, got {}", request.seed_line_number)));
    }
    if (request.seed_name.empty()) {
        return std::unexpected(request_error("seed_name must be a non-empty string"));
    }
    return request;
}

reposlice::Result<SliceRequest> request_from_json(const nlohmann::json& j,
                                                  std::string_view schema_dir,
                                                  std::string_view base_dir)
{
    if (auto valid = common::validate_json_named(j, schema_dir, kRequestSchemaVersion); !valid) {
        return std::unexpected(request_error("Invalid slice request: " + valid.error().message));
    }
    SliceRequest request{
        .slicing_request_id = j.at("slicing_request_id").get<std::string>(),
        .project_path = j.at("project_path").get<std::string>(),
        .file_path = j.at("file_path").get<std::string>(),
        .seed_line_number = j.at("seed_line_number").get<int>(),
        .seed_name = j.at("seed_name").get<std::string>(),
        .is_backward = j.value("is_backward", true),
    };
    return validate_request(std::move(request), base_dir);
}

reposlice::Result<SliceRequest> load_request(const std::string& path,
                                             std::string_view schema_dir,
                                             std::string_view base_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(request_error(document.error().message));
    }
    return request_from_json(*document, schema_dir, base_dir);
}

nlohmann::json to_json(const SliceRequest& request)
{
    return nlohmann::json{
        {"slicing_request_id", request.slicing_request_id},
        {"project_path", request.project_path},
        {"file_path", request.file_path},
        {"seed_line_number", request.seed_line_number},
        {"seed_name", request.seed_name},
        {"is_backward", request.is_backward},
    };
}

}  // namespace reposlice::io
