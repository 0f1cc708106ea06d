/**
 * @file syntax_index.cpp
 * @brief Per-file Clang parse, function definition and macro discovery
 */

#include "syntax_index.hpp"

#include "reposlice/log.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <ranges>
#include <utility>

#include <clang/AST/ASTContext.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/RecursiveASTVisitor.h>
#include <clang/Basic/SourceManager.h>
#include <clang/Lex/Lexer.h>
#include <clang/Lex/MacroInfo.h>
#include <clang/Lex/Preprocessor.h>
#include <clang/Serialization/PCHContainerOperations.h>
#include <clang/Tooling/CompilationDatabase.h>
#include <clang/Tooling/Tooling.h>
#include <llvm/ADT/IntrusiveRefCntPtr.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/VirtualFileSystem.h>

namespace reposlice::frontend_clang {

namespace {

[[nodiscard]] bool is_c_source(const std::string& path)
{
    return std::filesystem::path(path).extension() == ".c";
}

[[nodiscard]] bool is_c_header(const std::string& path)
{
    return std::filesystem::path(path).extension() == ".h";
}

[[nodiscard]] std::string directory_of(const std::string& path)
{
    return std::filesystem::path(path).parent_path().string();
}

[[nodiscard]] int line_of(const clang::SourceManager& sm, clang::SourceLocation loc)
{
    return static_cast<int>(sm.getExpansionLineNumber(loc));
}

/// Offset of the first byte of the line holding @p offset.
[[nodiscard]] unsigned line_start(std::string_view content, unsigned offset)
{
    const auto pos = content.rfind('\n', offset == 0 ? 0 : offset - 1);
    if (offset == 0 || pos == std::string_view::npos) {
        return 0;
    }
    return static_cast<unsigned>(pos + 1);
}

class FunctionDefinitionVisitor final : public clang::RecursiveASTVisitor<FunctionDefinitionVisitor>
{
public:
    FunctionDefinitionVisitor(const ParsedFile& file, std::vector<RawFunctionRecord>& out)
        : m_file(file)
        , m_sm(file.source_manager())
        , m_out(out)
    {}

    bool VisitFunctionDecl(clang::FunctionDecl* decl)
    {
        if (!decl->doesThisDeclarationHaveABody() || decl->isImplicit()) {
            return true;
        }
        if (!decl->getDeclName().isIdentifier() || decl->getLocation().isMacroID()) {
            return true;
        }
        const clang::SourceLocation begin = m_sm.getExpansionLoc(decl->getBeginLoc());
        const clang::SourceLocation end = m_sm.getExpansionLoc(decl->getEndLoc());
        if (!m_sm.isWrittenInMainFile(begin) || !m_sm.isWrittenInMainFile(end)) {
            return true;
        }

        // Definitions whose name sits more than one line below the start of the
        // declaration (long attribute or template preambles) are not modelled.
        const int start_line = line_of(m_sm, begin);
        const int name_line = line_of(m_sm, decl->getLocation());
        if (name_line != start_line && name_line != start_line + 1) {
            REPOSLICE_LOG_DEBUG("Skipping {} in {}: declarator on line {} of a definition starting at {}",
                                decl->getName().str(),
                                m_file.path(),
                                name_line,
                                start_line);
            return true;
        }

        const clang::SourceLocation after_end =
            clang::Lexer::getLocForEndOfToken(end, 0, m_sm, m_file.lang_options());
        const unsigned begin_offset = m_sm.getFileOffset(begin);
        const unsigned end_offset = after_end.isValid() ? m_sm.getFileOffset(after_end)
                                                        : m_sm.getFileOffset(end) + 1;
        const std::string& content = m_file.content();
        if (begin_offset >= end_offset || end_offset > content.size()) {
            return true;
        }

        m_out.push_back(RawFunctionRecord{
            .name = decl->getName().str(),
            .start_line = start_line,
            .end_line = line_of(m_sm, end),
            .begin_offset = begin_offset,
            .code = content.substr(begin_offset, end_offset - begin_offset),
            .decl = decl,
        });
        return true;
    }

private:
    const ParsedFile& m_file;
    const clang::SourceManager& m_sm;
    std::vector<RawFunctionRecord>& m_out;
};

}  // namespace

void DiagnosticCollector::HandleDiagnostic(clang::DiagnosticsEngine::Level level,
                                           const clang::Diagnostic& info)
{
    clang::DiagnosticConsumer::HandleDiagnostic(level, info);
    if (level >= clang::DiagnosticsEngine::Error && m_first_error.empty()) {
        llvm::SmallString<128> message;
        info.FormatDiagnostic(message);
        m_first_error = message.str().str();
    }
}

ParsedFile::ParsedFile(std::string path,
                       std::string content,
                       std::unique_ptr<DiagnosticCollector> diagnostics,
                       std::unique_ptr<clang::ASTUnit> unit)
    : m_path(std::move(path))
    , m_content(std::move(content))
    , m_diagnostics(std::move(diagnostics))
    , m_unit(std::move(unit))
{}

clang::ASTContext& ParsedFile::context() const
{
    return m_unit->getASTContext();
}

const clang::SourceManager& ParsedFile::source_manager() const
{
    return m_unit->getSourceManager();
}

const clang::LangOptions& ParsedFile::lang_options() const
{
    return m_unit->getLangOpts();
}

SyntaxIndex::SyntaxIndex(SyntaxIndexOptions options)
    : m_options(std::move(options))
{}

std::vector<std::string> SyntaxIndex::compile_args(const std::string& path) const
{
    std::vector<std::string> args;
    if (is_c_source(path) || (is_c_header(path) && m_options.c_header_dirs.contains(directory_of(path)))) {
        args.insert(args.end(), {"-xc", "-std=gnu11"});
    } else {
        args.insert(args.end(), {"-xc++", "-std=gnu++17"});
    }
    if (!m_options.project_root.empty()) {
        args.push_back("-I" + m_options.project_root);
    }
    const auto dir = directory_of(path);
    if (!dir.empty() && dir != m_options.project_root) {
        args.push_back("-I" + dir);
    }
    args.insert(args.end(), {"-Wno-everything", "-ferror-limit=0"});
    if (!m_options.resource_dir.empty()) {
        args.push_back("-resource-dir=" + m_options.resource_dir);
    }
    args.insert(args.end(), m_options.extra_args.begin(), m_options.extra_args.end());
    return args;
}

reposlice::Result<std::unique_ptr<ParsedFile>> SyntaxIndex::parse_file(const std::string& path,
                                                                       std::string text) const
{
    const auto dir = std::filesystem::path(path).parent_path().string();
    clang::tooling::FixedCompilationDatabase comp_db(dir.empty() ? "." : dir, compile_args(path));
    // Each tool gets its own physical file system so that setting the working
    // directory does not touch the process-wide one shared by other workers.
    llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> file_system(
        llvm::vfs::createPhysicalFileSystem().release());
    clang::tooling::ClangTool tool(comp_db,
                                   {path},
                                   std::make_shared<clang::PCHContainerOperations>(),
                                   file_system);

    auto diagnostics = std::make_unique<DiagnosticCollector>();
    tool.setDiagnosticConsumer(diagnostics.get());

    std::vector<std::unique_ptr<clang::ASTUnit>> units;
    const int rc = tool.buildASTs(units);
    if (units.empty() || units.front() == nullptr) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Clang produced no AST for {} (status {})", path, rc)));
    }
    auto unit = std::move(units.front());
    if (unit->getDiagnostics().hasFatalErrorOccurred()) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Fatal error while parsing {}: {}", path, diagnostics->first_error())));
    }
    if (diagnostics->getNumErrors() > 0) {
        REPOSLICE_LOG_DEBUG("{} parsed with {} error(s), first: {}",
                            path,
                            diagnostics->getNumErrors(),
                            diagnostics->first_error());
    }
    return std::make_unique<ParsedFile>(path, std::move(text), std::move(diagnostics), std::move(unit));
}

std::vector<RawFunctionRecord> SyntaxIndex::extract_functions(const ParsedFile& file) const
{
    std::vector<RawFunctionRecord> records;
    FunctionDefinitionVisitor visitor(file, records);
    visitor.TraverseDecl(file.context().getTranslationUnitDecl());
    std::ranges::stable_sort(records, {}, &RawFunctionRecord::begin_offset);
    return records;
}

std::vector<MacroRecord> SyntaxIndex::extract_macros(const ParsedFile& file) const
{
    std::vector<MacroRecord> records;
    const clang::Preprocessor& pp = file.unit().getPreprocessor();
    const clang::SourceManager& sm = file.source_manager();
    const std::string& content = file.content();

    for (const auto& entry : pp.macros(/*IncludeExternalMacros=*/false)) {
        const clang::IdentifierInfo* ident = entry.first;
        const clang::MacroInfo* info = pp.getMacroInfo(ident);
        if (info == nullptr || info->isBuiltinMacro() || info->isUsedForHeaderGuard()) {
            continue;
        }
        const clang::SourceLocation def_loc = info->getDefinitionLoc();
        if (def_loc.isInvalid() || !sm.isWrittenInMainFile(def_loc)) {
            continue;
        }

        const clang::SourceLocation def_end = clang::Lexer::getLocForEndOfToken(
            info->getDefinitionEndLoc(), 0, sm, file.lang_options());
        const unsigned name_offset = sm.getFileOffset(def_loc);
        const unsigned end_offset = def_end.isValid() ? sm.getFileOffset(def_end) : name_offset;
        const unsigned begin_offset = line_start(content, name_offset);
        if (end_offset > content.size() || begin_offset > end_offset) {
            continue;
        }

        MacroRecord record{
            .name = ident->getName().str(),
            .is_function_like = info->isFunctionLike(),
            .is_variadic = info->isVariadic(),
            .parameters = {},
            .start_line = line_of(sm, def_loc),
            .end_line = line_of(sm, info->getDefinitionEndLoc()),
            .definition = content.substr(begin_offset, end_offset - begin_offset),
            .replacement = {},
        };
        for (const clang::IdentifierInfo* param : info->params()) {
            record.parameters.push_back(param->getName().str());
        }
        if (info->getNumTokens() > 0) {
            const unsigned replacement_offset = sm.getFileOffset(info->tokens_begin()->getLocation());
            if (replacement_offset <= end_offset) {
                record.replacement = content.substr(replacement_offset, end_offset - replacement_offset);
            }
        }
        records.push_back(std::move(record));
    }
    std::ranges::sort(records, {}, &MacroRecord::start_line);
    return records;
}

reposlice::Result<FileSyntax> SyntaxIndex::index_file(const std::string& path) const
{
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto parsed = parse_file(path, std::move(*text));
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    FileSyntax syntax;
    syntax.functions = extract_functions(**parsed);
    syntax.macros = extract_macros(**parsed);
    syntax.file = std::move(*parsed);
    return syntax;
}

}  // namespace reposlice::frontend_clang
