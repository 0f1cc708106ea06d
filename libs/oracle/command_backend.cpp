/**
 * @file command_backend.cpp
 * @brief External command inference backend (llvm::sys process execution)
 */

#include "reposlice/prompted_oracle.hpp"

#include "reposlice/log.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/Program.h>

namespace reposlice::oracle {

namespace {

[[nodiscard]] reposlice::Result<std::string> find_program(llvm::StringRef name)
{
    llvm::ErrorOr<std::string> program = llvm::sys::findProgramByName(name);
    if (!program) {
        return std::unexpected(Error::make(
            "OracleError", std::format("Cannot find '{}' on PATH: {}", name.str(), program.getError().message())));
    }
    return *program;
}

[[nodiscard]] reposlice::Result<std::string> scratch_file(llvm::StringRef prefix)
{
    llvm::SmallString<128> path;
    if (std::error_code ec = llvm::sys::fs::createTemporaryFile(prefix, "txt", path)) {
        return std::unexpected(
            Error::make("OracleError", std::format("Failed to create scratch file: {}", ec.message())));
    }
    return std::string(path.str());
}

}  // namespace

CommandInferenceBackend::CommandInferenceBackend(CommandBackendOptions options)
    : m_options(std::move(options))
{}

reposlice::Result<std::string> CommandInferenceBackend::complete(std::string_view prompt)
{
    if (m_options.command.empty()) {
        return std::unexpected(Error::make("OracleError", "No oracle command configured"));
    }

    auto env_program = find_program("env");
    if (!env_program) {
        return std::unexpected(env_program.error());
    }
    auto shell = find_program("sh");
    if (!shell) {
        return std::unexpected(shell.error());
    }

    auto input = scratch_file("reposlice-prompt");
    if (!input) {
        return std::unexpected(input.error());
    }
    const llvm::FileRemover input_remover(*input);
    auto output = scratch_file("reposlice-response");
    if (!output) {
        return std::unexpected(output.error());
    }
    const llvm::FileRemover output_remover(*output);

    if (auto written = common::write_text_file(*input, prompt); !written) {
        return std::unexpected(Error::make("OracleError", written.error().message));
    }

    // env(1) adds the model settings on top of the inherited environment.
    const std::string model_var = "REPOSLICE_MODEL=" + m_options.model_name;
    const std::string temperature_var = std::format("REPOSLICE_TEMPERATURE={}", m_options.temperature);
    const std::vector<llvm::StringRef> args{"env", model_var, temperature_var, *shell, "-c", m_options.command};
    const std::optional<llvm::StringRef> redirects[] = {llvm::StringRef(*input),
                                                        llvm::StringRef(*output),
                                                        std::nullopt};

    const unsigned seconds_to_wait = m_options.timeout_seconds > 0 ? static_cast<unsigned>(m_options.timeout_seconds)
                                                                   : 0U;
    std::string error_message;
    bool execution_failed = false;
    const auto started = std::chrono::steady_clock::now();
    const int status = llvm::sys::ExecuteAndWait(*env_program,
                                                 args,
                                                 std::nullopt,
                                                 redirects,
                                                 seconds_to_wait,
                                                 0,
                                                 &error_message,
                                                 &execution_failed);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (execution_failed) {
        return std::unexpected(
            Error::make("OracleError", std::format("Failed to run oracle command: {}", error_message)));
    }
    if (status < 0) {
        if (seconds_to_wait > 0 && elapsed >= std::chrono::seconds(seconds_to_wait)) {
            return std::unexpected(Error::make(
                "OracleError", std::format("Oracle command timed out after {}s", m_options.timeout_seconds)));
        }
        return std::unexpected(
            Error::make("OracleError", std::format("Oracle command terminated abnormally: {}", error_message)));
    }
    if (status != 0) {
        return std::unexpected(
            Error::make("OracleError", std::format("Oracle command exited with status {}", status)));
    }

    REPOSLICE_LOG_TRACE("Oracle command finished for a {}-byte prompt", prompt.size());
    auto response = common::read_text_file(*output);
    if (!response) {
        return std::unexpected(Error::make("OracleError", response.error().message));
    }
    return response;
}

}  // namespace reposlice::oracle
