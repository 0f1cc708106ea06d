#pragma once

/**
 * @file syntax_index.hpp
 * @brief Clang parsing of one source file into raw function and macro records
 */

#include "reposlice/common.hpp"
#include "reposlice/program_model.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <clang/Basic/Diagnostic.h>
#include <clang/Frontend/ASTUnit.h>

namespace clang {
class ASTContext;
class FunctionDecl;
class SourceManager;
class LangOptions;
}  // namespace clang

namespace reposlice::frontend_clang {

/// Counts diagnostics and keeps the first error message for logging.
class DiagnosticCollector final : public clang::DiagnosticConsumer
{
public:
    void HandleDiagnostic(clang::DiagnosticsEngine::Level level,
                          const clang::Diagnostic& info) override;

    [[nodiscard]] const std::string& first_error() const { return m_first_error; }

private:
    std::string m_first_error;
};

/**
 * @brief One parsed translation unit, owned by the ProgramModel.
 *
 * The diagnostic consumer is referenced by the unit's DiagnosticsEngine, so it
 * is declared first and destroyed last.
 */
class ParsedFile final : public model::SyntaxUnit
{
public:
    ParsedFile(std::string path,
               std::string content,
               std::unique_ptr<DiagnosticCollector> diagnostics,
               std::unique_ptr<clang::ASTUnit> unit);

    [[nodiscard]] const std::string& path() const override { return m_path; }
    [[nodiscard]] const std::string& content() const { return m_content; }
    [[nodiscard]] clang::ASTContext& context() const;
    [[nodiscard]] const clang::SourceManager& source_manager() const;
    [[nodiscard]] const clang::LangOptions& lang_options() const;
    [[nodiscard]] clang::ASTUnit& unit() const { return *m_unit; }
    [[nodiscard]] const DiagnosticCollector& diagnostics() const { return *m_diagnostics; }

private:
    std::string m_path;
    std::string m_content;
    std::unique_ptr<DiagnosticCollector> m_diagnostics;
    std::unique_ptr<clang::ASTUnit> m_unit;
};

struct RawFunctionRecord
{
    std::string name;
    int start_line = 0;
    int end_line = 0;
    unsigned begin_offset = 0;
    std::string code;
    const clang::FunctionDecl* decl = nullptr;
};

struct MacroRecord
{
    std::string name;
    bool is_function_like = false;
    bool is_variadic = false;
    std::vector<std::string> parameters;
    int start_line = 0;
    int end_line = 0;
    std::string definition;   ///< full "#define" body from the name onwards
    std::string replacement;  ///< replacement list only
};

/// Everything phase one produces for one file.
struct FileSyntax
{
    std::unique_ptr<ParsedFile> file;
    std::vector<RawFunctionRecord> functions;
    std::vector<MacroRecord> macros;
};

struct SyntaxIndexOptions
{
    std::string project_root;
    std::vector<std::string> extra_args;
    std::string resource_dir;
    /// Directories whose ".h" files are parsed as C; elsewhere headers are C++.
    std::set<std::string> c_header_dirs;
};

class SyntaxIndex
{
public:
    explicit SyntaxIndex(SyntaxIndexOptions options);

    /**
     * Parse @p text as the contents of @p path.
     *
     * Fails when no AST could be built or a fatal diagnostic (for example a
     * missing include) was raised; the caller then drops the whole file.
     */
    [[nodiscard]] reposlice::Result<std::unique_ptr<ParsedFile>> parse_file(const std::string& path,
                                                                           std::string text) const;

    /**
     * Function and method definitions written in the file whose declarator
     * begins on the definition's first line or the line after it.
     */
    [[nodiscard]] std::vector<RawFunctionRecord> extract_functions(const ParsedFile& file) const;

    /// Object-like and function-like macros defined in the file itself.
    [[nodiscard]] std::vector<MacroRecord> extract_macros(const ParsedFile& file) const;

    /// Read, parse and run both extraction passes.
    [[nodiscard]] reposlice::Result<FileSyntax> index_file(const std::string& path) const;

    [[nodiscard]] std::vector<std::string> compile_args(const std::string& path) const;

private:
    SyntaxIndexOptions m_options;
};

}  // namespace reposlice::frontend_clang
