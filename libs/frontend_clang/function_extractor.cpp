/**
 * @file function_extractor.cpp
 * @brief Parameters, returns, call sites and scopes of one function definition
 */

#include "function_extractor.hpp"

#include "reposlice/call_graph.hpp"
#include "reposlice/log.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

#include <clang/AST/ASTContext.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/Expr.h>
#include <clang/AST/ExprCXX.h>
#include <clang/AST/RecursiveASTVisitor.h>
#include <clang/AST/Stmt.h>
#include <clang/AST/StmtCXX.h>
#include <clang/Basic/SourceManager.h>
#include <clang/Lex/Lexer.h>
#include <llvm/ADT/StringRef.h>

namespace reposlice::frontend_clang {

namespace {

using model::CallSite;
using model::LineSpan;
using model::Value;
using model::ValueInit;
using model::ValueLabel;

struct PendingArgument
{
    std::string text;
    int line = 0;
    int index = -1;
    ValueLabel label = ValueLabel::kArg;
};

/// A call site before ids are assigned.
struct PendingCall
{
    unsigned offset = 0;
    std::string callee_text;
    std::string text;
    int start_line = 0;
    int end_line = 0;
    std::vector<PendingArgument> arguments;
};

struct PendingReturn
{
    std::string text;
    int line = 0;
};

/// Source text and line helpers over one parsed file.
class SourceView
{
public:
    explicit SourceView(const ParsedFile& file)
        : m_sm(file.source_manager())
        , m_lang(file.lang_options())
    {}

    [[nodiscard]] const clang::SourceManager& sm() const { return m_sm; }

    [[nodiscard]] int line(clang::SourceLocation loc) const
    {
        return static_cast<int>(m_sm.getExpansionLineNumber(m_sm.getFileLoc(loc)));
    }

    [[nodiscard]] std::string text(clang::SourceRange range) const
    {
        const clang::SourceLocation begin = m_sm.getFileLoc(range.getBegin());
        const clang::SourceLocation end = m_sm.getFileLoc(range.getEnd());
        if (begin.isInvalid() || end.isInvalid()) {
            return {};
        }
        return clang::Lexer::getSourceText(clang::CharSourceRange::getTokenRange(begin, end), m_sm, m_lang)
            .str();
    }

    [[nodiscard]] unsigned offset(clang::SourceLocation loc) const
    {
        return m_sm.getFileOffset(m_sm.getFileLoc(loc));
    }

    [[nodiscard]] bool from_macro_body(clang::SourceLocation loc) const
    {
        return loc.isMacroID() && m_sm.isMacroBodyExpansion(loc);
    }

    [[nodiscard]] LineSpan span(clang::SourceRange range) const
    {
        return LineSpan{.start = line(range.getBegin()), .end = line(range.getEnd())};
    }

    /// Loop body lines; an empty compound body collapses onto the header's last line.
    [[nodiscard]] LineSpan body_span(const clang::Stmt* body, int header_end) const
    {
        if (body == nullptr) {
            return LineSpan{.start = header_end, .end = header_end};
        }
        const auto* compound = clang::dyn_cast<clang::CompoundStmt>(body);
        if (compound == nullptr) {
            return span(body->getSourceRange());
        }
        if (compound->body_empty()) {
            return LineSpan{.start = header_end, .end = header_end};
        }
        int start = line(compound->body_front()->getBeginLoc());
        int end = start;
        for (const clang::Stmt* child : compound->body()) {
            start = std::min(start, line(child->getBeginLoc()));
            end = std::max(end, line(child->getEndLoc()));
        }
        return LineSpan{.start = start, .end = end};
    }

private:
    const clang::SourceManager& m_sm;
    const clang::LangOptions& m_lang;
};

class BodyVisitor final : public clang::RecursiveASTVisitor<BodyVisitor>
{
public:
    explicit BodyVisitor(const SourceView& view)
        : m_view(view)
    {}

    bool TraverseLambdaExpr(clang::LambdaExpr* lambda)
    {
        ++m_lambda_depth;
        const bool result = clang::RecursiveASTVisitor<BodyVisitor>::TraverseLambdaExpr(lambda);
        --m_lambda_depth;
        return result;
    }

    bool VisitReturnStmt(clang::ReturnStmt* stmt)
    {
        const clang::Expr* value = stmt->getRetValue();
        if (m_lambda_depth > 0 || value == nullptr || m_view.from_macro_body(stmt->getBeginLoc())) {
            return true;
        }
        m_returns.push_back(PendingReturn{
            .text = m_view.text(value->getSourceRange()),
            .line = m_view.line(stmt->getBeginLoc()),
        });
        return true;
    }

    bool VisitCallExpr(clang::CallExpr* call)
    {
        if (clang::isa<clang::CXXOperatorCallExpr, clang::UserDefinedLiteral>(call)) {
            return true;
        }
        if (m_view.from_macro_body(call->getBeginLoc())) {
            return true;
        }
        const auto* member_call = clang::dyn_cast<clang::CXXMemberCallExpr>(call);
        if (member_call != nullptr
            && clang::isa_and_nonnull<clang::CXXConversionDecl>(member_call->getMethodDecl())) {
            return true;
        }

        PendingCall pending{
            .offset = m_view.offset(call->getBeginLoc()),
            .callee_text = {},
            .text = m_view.text(call->getSourceRange()),
            .start_line = m_view.line(call->getBeginLoc()),
            .end_line = m_view.line(call->getEndLoc()),
            .arguments = {},
        };
        if (const clang::Expr* callee = call->getCallee(); callee != nullptr) {
            pending.callee_text = m_view.text(callee->getSourceRange());
        }
        if (pending.callee_text.empty()) {
            pending.callee_text = pending.text;
        }

        for (unsigned index = 0; index < call->getNumArgs(); ++index) {
            const clang::Expr* arg = call->getArg(index);
            if (clang::isa<clang::CXXDefaultArgExpr>(arg)) {
                continue;
            }
            pending.arguments.push_back(PendingArgument{
                .text = m_view.text(arg->getSourceRange()),
                .line = m_view.line(arg->getBeginLoc()),
                .index = static_cast<int>(index),
                .label = ValueLabel::kArg,
            });
        }

        if (member_call != nullptr) {
            if (const clang::Expr* object = member_call->getImplicitObjectArgument(); object != nullptr) {
                const bool implicit_this = object->isImplicitCXXThis();
                pending.arguments.push_back(PendingArgument{
                    .text = implicit_this ? std::string("this") : m_view.text(object->getSourceRange()),
                    .line = implicit_this ? pending.start_line : m_view.line(object->getBeginLoc()),
                    .index = -1,
                    .label = ValueLabel::kObjArg,
                });
            }
        }
        m_calls.push_back(std::move(pending));
        return true;
    }

    bool VisitIfStmt(clang::IfStmt* stmt)
    {
        const clang::Expr* condition = stmt->getCond();
        if (condition == nullptr || stmt->getThen() == nullptr || m_view.from_macro_body(stmt->getBeginLoc())) {
            return true;
        }
        model::IfScope scope{
            .condition = m_view.span(condition->getSourceRange()),
            .condition_text = m_view.text(condition->getSourceRange()),
            .true_branch = m_view.span(stmt->getThen()->getSourceRange()),
            .else_branch = {},
        };
        if (const clang::Stmt* else_branch = stmt->getElse(); else_branch != nullptr) {
            scope.else_branch = LineSpan{.start = m_view.line(stmt->getElseLoc()),
                                         .end = m_view.line(else_branch->getEndLoc())};
        }
        m_if_scopes.emplace_back(m_view.span(stmt->getSourceRange()), std::move(scope));
        return true;
    }

    bool VisitForStmt(clang::ForStmt* stmt)
    {
        add_loop(stmt, stmt->getLParenLoc(), stmt->getRParenLoc(), stmt->getBody());
        return true;
    }

    bool VisitWhileStmt(clang::WhileStmt* stmt)
    {
        add_loop(stmt, stmt->getLParenLoc(), stmt->getRParenLoc(), stmt->getBody());
        return true;
    }

    bool VisitCXXForRangeStmt(clang::CXXForRangeStmt* stmt)
    {
        add_loop(stmt, stmt->getForLoc(), stmt->getRParenLoc(), stmt->getBody());
        return true;
    }

    bool VisitDoStmt(clang::DoStmt* stmt)
    {
        add_loop(stmt, stmt->getWhileLoc(), stmt->getRParenLoc(), stmt->getBody());
        return true;
    }

    [[nodiscard]] std::vector<PendingCall>& calls() { return m_calls; }
    [[nodiscard]] const std::vector<PendingReturn>& returns() const { return m_returns; }
    [[nodiscard]] const std::vector<std::pair<LineSpan, model::IfScope>>& if_scopes() const
    {
        return m_if_scopes;
    }
    [[nodiscard]] const std::vector<std::pair<LineSpan, model::LoopScope>>& loop_scopes() const
    {
        return m_loop_scopes;
    }

private:
    void add_loop(const clang::Stmt* loop,
                  clang::SourceLocation header_begin,
                  clang::SourceLocation header_end,
                  const clang::Stmt* body)
    {
        if (header_begin.isInvalid() || header_end.isInvalid() || m_view.from_macro_body(loop->getBeginLoc())) {
            return;
        }
        const LineSpan header{.start = m_view.line(header_begin), .end = m_view.line(header_end)};
        m_loop_scopes.emplace_back(m_view.span(loop->getSourceRange()),
                                   model::LoopScope{
                                       .header = header,
                                       .header_text = m_view.text(clang::SourceRange(header_begin, header_end)),
                                       .body = m_view.body_span(body, header.end),
                                   });
    }

    const SourceView& m_view;
    int m_lambda_depth = 0;
    std::vector<PendingCall> m_calls;
    std::vector<PendingReturn> m_returns;
    std::vector<std::pair<LineSpan, model::IfScope>> m_if_scopes;
    std::vector<std::pair<LineSpan, model::LoopScope>> m_loop_scopes;
};

/**
 * Invocations of project function-like macros between two file offsets.
 *
 * Macro invocations leave no CallExpr of their own in the AST, so the body is
 * re-lexed in raw mode and "NAME(" sequences are matched against the known
 * macro names.
 */
[[nodiscard]] std::vector<PendingCall> scan_macro_invocations(const SourceView& view,
                                                              const clang::LangOptions& lang,
                                                              unsigned begin_offset,
                                                              unsigned end_offset,
                                                              const MacroNameSet& macro_names)
{
    std::vector<PendingCall> calls;
    const clang::SourceManager& sm = view.sm();
    const clang::FileID fid = sm.getMainFileID();
    const llvm::StringRef buffer = sm.getBufferData(fid);
    const std::string_view content(buffer.data(), buffer.size());
    if (macro_names.empty() || begin_offset >= end_offset || end_offset > content.size()) {
        return calls;
    }
    const auto line_at = [&sm, fid](unsigned offset) {
        return static_cast<int>(sm.getLineNumber(fid, offset));
    };

    clang::Lexer lexer(sm.getLocForStartOfFile(fid),
                       lang,
                       content.data(),
                       content.data() + begin_offset,
                       content.data() + content.size());

    std::vector<clang::Token> tokens;
    clang::Token token;
    while (true) {
        lexer.LexFromRawLexer(token);
        if (token.is(clang::tok::eof) || sm.getFileOffset(token.getLocation()) >= end_offset) {
            break;
        }
        tokens.push_back(token);
    }

    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (!tokens[i].is(clang::tok::raw_identifier) || !tokens[i + 1].is(clang::tok::l_paren)) {
            continue;
        }
        const std::string name = tokens[i].getRawIdentifier().str();
        if (!macro_names.contains(name)) {
            continue;
        }

        PendingCall pending{
            .offset = sm.getFileOffset(tokens[i].getLocation()),
            .callee_text = name,
            .text = {},
            .start_line = 0,
            .end_line = 0,
            .arguments = {},
        };
        int depth = 0;
        int arg_index = 0;
        std::optional<unsigned> arg_begin;
        unsigned arg_end = 0;
        std::optional<std::size_t> close;
        const auto flush_argument = [&]() {
            if (arg_begin) {
                pending.arguments.push_back(PendingArgument{
                    .text = std::string(common::trim(content.substr(*arg_begin, arg_end - *arg_begin))),
                    .line = line_at(*arg_begin),
                    .index = arg_index,
                    .label = ValueLabel::kArg,
                });
            }
            ++arg_index;
            arg_begin.reset();
        };

        for (std::size_t j = i + 1; j < tokens.size(); ++j) {
            const clang::Token& tok = tokens[j];
            const unsigned tok_offset = sm.getFileOffset(tok.getLocation());
            if (tok.isOneOf(clang::tok::l_paren, clang::tok::l_square, clang::tok::l_brace)) {
                ++depth;
                if (depth == 1) {
                    continue;
                }
            } else if (tok.isOneOf(clang::tok::r_paren, clang::tok::r_square, clang::tok::r_brace)) {
                --depth;
                if (depth == 0) {
                    // "NAME()" has no arguments; "NAME(a)" has one.
                    if (arg_begin || arg_index > 0) {
                        flush_argument();
                    }
                    close = j;
                    break;
                }
            } else if (tok.is(clang::tok::comma) && depth == 1) {
                flush_argument();
                continue;
            }
            if (!arg_begin) {
                arg_begin = tok_offset;
            }
            arg_end = tok_offset + tok.getLength();
        }
        if (!close) {
            continue;
        }

        const unsigned end = sm.getFileOffset(tokens[*close].getLocation()) + tokens[*close].getLength();
        pending.text = std::string(content.substr(pending.offset, end - pending.offset));
        pending.start_line = line_at(pending.offset);
        pending.end_line = line_at(end - 1);
        calls.push_back(std::move(pending));
    }
    return calls;
}

}  // namespace

FunctionModelBuilder::FunctionModelBuilder(const ParsedFile& file, const MacroNameSet& macro_names)
    : m_file(file)
    , m_macro_names(macro_names)
{}

reposlice::VoidResult FunctionModelBuilder::build(model::Function& function) const
{
    const clang::FunctionDecl* decl = function.decl();
    if (decl == nullptr || decl->getBody() == nullptr) {
        return std::unexpected(Error::make(
            "AnalysisError", std::format("Function {} ({}) has no body to analyze", function.name(), function.id())));
    }
    const SourceView view(m_file);

    const auto make_value = [&function](std::string name, ValueLabel label, int file_line, int index) {
        return Value(ValueInit{
            .name = std::move(name),
            .label = label,
            .file_path = function.file_path(),
            .line_in_file = file_line,
            .function_id = function.id(),
            .function_name = function.name(),
            .line_in_function = function.to_function_line(file_line),
            .index = index,
            .comment = std::nullopt,
        });
    };

    // Parameters
    for (unsigned index = 0; index < decl->getNumParams(); ++index) {
        const clang::ParmVarDecl* param = decl->getParamDecl(index);
        if (param->getName().empty()) {
            continue;
        }
        function.add_parameter(make_value(
            param->getName().str(), ValueLabel::kPara, view.line(param->getLocation()), static_cast<int>(index)));
    }
    if (decl->isVariadic()) {
        function.add_parameter(make_value(
            "...", ValueLabel::kVariPara, function.start_line(), static_cast<int>(decl->getNumParams())));
    }
    if (const auto* method = clang::dyn_cast<clang::CXXMethodDecl>(decl); method != nullptr && method->isInstance()) {
        function.add_parameter(make_value("this", ValueLabel::kObjPara, function.start_line(), -1));
    }

    BodyVisitor visitor(view);
    clang::Stmt* body = decl->getBody();
    if (!visitor.TraverseStmt(body)) {
        return std::unexpected(Error::make(
            "AnalysisError", std::format("Traversal of {} ({}) was interrupted", function.name(), function.id())));
    }

    for (const auto& ret : visitor.returns()) {
        function.add_return_value(make_value(ret.text, ValueLabel::kRet, ret.line, 0));
    }
    for (const auto& [span, scope] : visitor.if_scopes()) {
        function.add_if_scope(span, scope);
    }
    for (const auto& [span, scope] : visitor.loop_scopes()) {
        function.add_loop_scope(span, scope);
    }

    std::vector<PendingCall> calls = std::move(visitor.calls());
    auto macro_calls = scan_macro_invocations(view,
                                              m_file.lang_options(),
                                              view.offset(body->getBeginLoc()),
                                              view.offset(body->getEndLoc()) + 1,
                                              m_macro_names);
    calls.insert(calls.end(),
                 std::make_move_iterator(macro_calls.begin()),
                 std::make_move_iterator(macro_calls.end()));
    std::ranges::stable_sort(calls, {}, &PendingCall::offset);

    for (auto [position, call] : std::views::enumerate(calls)) {
        const auto site_id = static_cast<model::CallSiteId>(position + 1);
        CallSite site{
            .id = site_id,
            .callee_text = call.callee_text,
            .callee_name = callgraph::callee_name_from_text(call.callee_text),
            .start_line = function.to_function_line(call.start_line),
            .end_line = function.to_function_line(call.end_line),
            .text = call.text,
        };
        for (auto& arg : call.arguments) {
            function.add_argument(site_id, make_value(std::move(arg.text), arg.label, arg.line, arg.index));
        }
        function.set_output_value(site_id, make_value(call.text, ValueLabel::kOut, call.start_line, -1));
        function.add_call_site(std::move(site));
    }

    REPOSLICE_LOG_TRACE("{}: {} parameter(s), {} return(s), {} call site(s)",
                        function.name(),
                        function.parameters().size(),
                        function.return_values().size(),
                        function.call_sites().size());
    return {};
}

}  // namespace reposlice::frontend_clang
