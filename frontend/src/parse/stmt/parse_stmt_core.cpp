// frontend/src/parse/stmt/parse_stmt_core.cpp
#include <onec/parse/Parser.hpp>


namespace onec {

    using K = syntax::TokenKind;

    ast::StmtId Parser::parse_stmt() {
        return parse_stmt_any();
    }

    ast::StmtId Parser::parse_block() {
        // 첫 토큰으로 두 형태를 구분한다
        if (cursor_.at(K::kLBrace)) return parse_block_brace();
        return parse_block_implied();
    }

    ast::StmtId Parser::parse_block_brace() {
        const Token lb = cursor_.bump(); // '{'
        std::vector<ast::StmtId> children;

        while (!aborted_ && !cursor_.at_eof()) {
            skip_newlines();
            if (cursor_.at(K::kRBrace) || cursor_.at_eof()) break;
            children.push_back(parse_stmt_any());
        }

        Span sp = lb.span;
        if (!aborted_) {
            sp = span_join(sp, cursor_.peek().span);
            if (!diag_expect(K::kRBrace)) return error_stmt(lb.span);
        }
        if (aborted_) return error_stmt(lb.span);

        ast::Stmt s{};
        s.kind = ast::StmtKind::kBlock;
        s.span = sp;
        s.stmt_begin = static_cast<uint32_t>(ast_.stmt_children().size());
        for (auto id : children) ast_.add_stmt_child(id);
        s.stmt_count = static_cast<uint32_t>(children.size());
        return ast_.add_stmt(s);
    }

    ast::StmtId Parser::parse_block_implied() {
        Span sp = cursor_.peek().span;
        std::vector<ast::StmtId> children;

        while (!aborted_ && !cursor_.at_eof()) {
            skip_newlines();
            if (cursor_.at_eof()) break;

            // 다음 선언 또는 바깥 if/ensure의 else/otherwise, 감싸는 '}'에서 끝난다
            const K k = cursor_.peek().kind;
            if (k == K::kKwFunction || k == K::kKwElse || k == K::kKwOtherwise || k == K::kRBrace) break;

            const ast::StmtId id = parse_stmt_any();
            if (aborted_) break;
            sp = span_join(sp, ast_.stmt(id).span);
            children.push_back(id);
        }

        if (aborted_) return error_stmt(sp);

        ast::Stmt s{};
        s.kind = ast::StmtKind::kBlock;
        s.span = sp;
        s.stmt_begin = static_cast<uint32_t>(ast_.stmt_children().size());
        for (auto id : children) ast_.add_stmt_child(id);
        s.stmt_count = static_cast<uint32_t>(children.size());
        return ast_.add_stmt(s);
    }

    ast::StmtId Parser::parse_stmt_any() {
        skip_newlines();

        const Token& t = cursor_.peek();
        switch (t.kind) {
            case K::kKwReturn:
                return parse_stmt_return();
            case K::kKwIf:
                return parse_stmt_cond(ast::StmtKind::kIf);
            case K::kKwEnsure:
                return parse_stmt_cond(ast::StmtKind::kEnsure);
            case K::kKwWhile:
                return parse_stmt_while();
            case K::kKwBreak:
            case K::kKwContinue: {
                ast::Stmt s{};
                s.kind = (t.kind == K::kKwBreak) ? ast::StmtKind::kBreak : ast::StmtKind::kContinue;
                s.span = t.span;
                cursor_.bump();
                return ast_.add_stmt(s);
            }
            default:
                return parse_stmt_expr_or_assign();
        }
    }

    ast::StmtId Parser::parse_stmt_return() {
        const Token kw = cursor_.bump(); // 'return'

        ast::Stmt s{};
        s.kind = ast::StmtKind::kReturn;
        s.span = kw.span;

        // 값 없는 return: 줄 끝, 입력 끝, 블록 끝
        if (!cursor_.at(K::kNewline) && !cursor_.at_eof() && !cursor_.at(K::kRBrace)) {
            s.expr = parse_expr();
            if (aborted_) return error_stmt(kw.span);
            s.span = span_join(kw.span, ast_.expr(s.expr).span);
        }
        return ast_.add_stmt(s);
    }

    /// if expr ':' Block [else ':' Block]
    /// ensure expr ':' Block [otherwise ':' Block]
    ast::StmtId Parser::parse_stmt_cond(ast::StmtKind kind) {
        const Token kw = cursor_.bump();
        const K else_kw = (kind == ast::StmtKind::kIf) ? K::kKwElse : K::kKwOtherwise;

        ast::Stmt s{};
        s.kind = kind;
        s.span = kw.span;

        s.expr = parse_expr();
        if (!diag_expect(K::kColon)) return error_stmt(kw.span);
        skip_newlines();

        s.a = parse_block();
        if (aborted_) return error_stmt(kw.span);

        if (at_after_newlines(else_kw)) {
            skip_newlines();
            cursor_.bump();
            if (!diag_expect(K::kColon)) return error_stmt(kw.span);
            skip_newlines();

            s.b = parse_block();
            if (aborted_) return error_stmt(kw.span);
        }

        return ast_.add_stmt(s);
    }

    ast::StmtId Parser::parse_stmt_while() {
        const Token kw = cursor_.bump(); // 'while'

        ast::Stmt s{};
        s.kind = ast::StmtKind::kWhile;
        s.span = kw.span;

        s.expr = parse_expr();
        if (!diag_expect(K::kColon)) return error_stmt(kw.span);
        skip_newlines();

        s.a = parse_block();
        if (aborted_) return error_stmt(kw.span);
        return ast_.add_stmt(s);
    }

    ast::StmtId Parser::parse_stmt_expr_or_assign() {
        const ast::ExprId e = parse_expr();
        if (aborted_) return error_stmt(cursor_.peek().span);

        ast::Stmt s{};
        s.span = ast_.expr(e).span;

        // 표현식 뒤에 할당 연산자가 오면 target/value 쌍으로 재해석
        if (syntax::is_assign_op(cursor_.peek().kind)) {
            s.kind = ast::StmtKind::kAssign;
            s.op = cursor_.bump().kind;
            s.target = e;
            s.expr = parse_expr();
            if (aborted_) return error_stmt(s.span);
            s.span = span_join(s.span, ast_.expr(s.expr).span);
            return ast_.add_stmt(s);
        }

        s.kind = ast::StmtKind::kExprStmt;
        s.expr = e;
        return ast_.add_stmt(s);
    }

} // namespace onec
