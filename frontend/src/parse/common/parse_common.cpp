// frontend/src/parse/common/parse_common.cpp
#include <onec/parse/Parser.hpp>
#include <onec/syntax/TokenKind.hpp>
#include <onec/diag/DiagCode.hpp>

#include <string>


namespace onec {

    void Parser::diag_report(diag::Code code, Span span, std::string_view a0, std::string_view a1) {
        if (aborted_) return;

        // 오류 복구 없음: 첫 진단에서 중단한다
        aborted_ = true;
        if (!diags_) return;

        diag::Diagnostic d(diag::Severity::kError, code, span);
        if (!a0.empty()) d.add_arg(a0);
        if (!a1.empty()) d.add_arg(a1);
        diags_->add(std::move(d));
    }

    std::string_view Parser::describe(const Token& t) const {
        switch (t.kind) {
            case syntax::TokenKind::kEof: return "end of input";
            case syntax::TokenKind::kNewline: return "newline";
            default: return t.lexeme;
        }
    }

    bool Parser::diag_expect(syntax::TokenKind k) {
        if (aborted_) return false;

        if (cursor_.at(k)) {
            cursor_.bump();
            return true;
        }

        const Token& got = cursor_.peek();
        const std::string want = "'" + std::string(syntax::token_kind_name(k)) + "'";
        if (got.kind == syntax::TokenKind::kEof) {
            diag_report(diag::Code::kUnexpectedEof, got.span, want);
            return false;
        }

        diag_report(diag::Code::kExpectedToken, got.span, want, describe(got));
        return false;
    }

    void Parser::skip_newlines() {
        while (cursor_.eat(syntax::TokenKind::kNewline)) {}
    }

    bool Parser::at_after_newlines(syntax::TokenKind k) const {
        size_t i = 0;
        while (cursor_.peek(i).kind == syntax::TokenKind::kNewline) ++i;
        return cursor_.peek(i).kind == k;
    }

    bool Parser::is_section_keyword(syntax::TokenKind k) const {
        using K = syntax::TokenKind;
        return k == K::kKwInputs || k == K::kKwOutputs
            || k == K::kKwRequirements || k == K::kKwImplementation;
    }

    ast::ExprId Parser::error_expr(Span sp) {
        ast::Expr e{};
        e.kind = ast::ExprKind::kError;
        e.span = sp;
        return ast_.add_expr(e);
    }

    ast::StmtId Parser::error_stmt(Span sp) {
        ast::Stmt s{};
        s.kind = ast::StmtKind::kError;
        s.span = sp;
        return ast_.add_stmt(s);
    }

} // namespace onec
