// frontend/src/parse/expr/parse_expr_core.cpp
#include <onec/parse/Parser.hpp>

#include <string>
#include <variant>


namespace onec {

    using K = syntax::TokenKind;

    int Parser::infix_prec(K k) {
        switch (k) {
            case K::kKwOr: return 1;
            case K::kKwAnd: return 2;
            case K::kEqEq:
            case K::kBangEq: return 3;
            case K::kLt:
            case K::kGt:
            case K::kLtEq:
            case K::kGtEq: return 4;
            case K::kPlus:
            case K::kMinus: return 5;
            case K::kStar:
            case K::kSlash:
            case K::kPercent: return 6;
            default: return -1;
        }
    }

    ast::ExprId Parser::parse_expr() {
        return parse_expr_binary(1);
    }

    ast::ExprId Parser::parse_expr_binary(int min_prec) {
        ast::ExprId lhs = parse_expr_unary();

        while (!aborted_) {
            const K k = cursor_.peek().kind;
            const int prec = infix_prec(k);
            if (prec < min_prec) break;

            cursor_.bump();

            // 같은 우선순위는 왼쪽으로 묶는다
            const ast::ExprId rhs = parse_expr_binary(prec + 1);
            if (aborted_) break;

            ast::Expr e{};
            e.kind = ast::ExprKind::kBinary;
            e.op = k;
            e.a = lhs;
            e.b = rhs;
            e.span = span_join(ast_.expr(lhs).span, ast_.expr(rhs).span);
            lhs = ast_.add_expr(e);
        }

        return lhs;
    }

    ast::ExprId Parser::parse_expr_unary() {
        const K k = cursor_.peek().kind;
        if (k == K::kMinus || k == K::kKwNot || k == K::kTilde) {
            const Token op = cursor_.bump();
            const ast::ExprId operand = parse_expr_unary();
            if (aborted_) return error_expr(op.span);

            ast::Expr e{};
            e.kind = ast::ExprKind::kUnary;
            e.op = k;
            e.a = operand;
            e.span = span_join(op.span, ast_.expr(operand).span);
            return ast_.add_expr(e);
        }

        const ast::ExprId base = parse_expr_primary();
        if (aborted_) return base;
        return parse_expr_postfix(base);
    }

    ast::ExprId Parser::parse_expr_postfix(ast::ExprId base) {
        ast::ExprId cur = base;

        while (!aborted_) {
            const Token& t = cursor_.peek();

            if (t.kind == K::kLParen) {
                cursor_.bump();
                const auto [b, n] = parse_expr_list(K::kRParen);
                if (aborted_) break;

                ast::Expr e{};
                e.kind = ast::ExprKind::kCall;
                e.a = cur;
                e.arg_begin = b;
                e.arg_count = n;
                e.span = span_join(ast_.expr(cur).span, cursor_.prev().span);
                cur = ast_.add_expr(e);
                continue;
            }

            if (t.kind == K::kDot) {
                cursor_.bump();
                const Token& m = cursor_.peek();
                if (!diag_expect(K::kIdent)) break;

                ast::Expr e{};
                e.kind = ast::ExprKind::kMember;
                e.a = cur;
                e.text = m.lexeme;
                e.span = span_join(ast_.expr(cur).span, m.span);
                cur = ast_.add_expr(e);
                continue;
            }

            if (t.kind == K::kLBracket) {
                cursor_.bump();
                const ast::ExprId idx = parse_expr();
                if (!diag_expect(K::kRBracket)) break;

                ast::Expr e{};
                e.kind = ast::ExprKind::kIndex;
                e.a = cur;
                e.b = idx;
                e.span = span_join(ast_.expr(cur).span, cursor_.prev().span);
                cur = ast_.add_expr(e);
                continue;
            }

            break;
        }

        return cur;
    }

    ast::ExprId Parser::parse_expr_primary() {
        const Token& t = cursor_.peek();

        ast::Expr e{};
        e.span = t.span;
        e.text = t.lexeme;

        switch (t.kind) {
            case K::kKwTrue:
            case K::kKwFalse:
                e.kind = ast::ExprKind::kBoolLit;
                e.bool_value = (t.kind == K::kKwTrue);
                cursor_.bump();
                return ast_.add_expr(e);

            case K::kKwNull:
                e.kind = ast::ExprKind::kNullLit;
                cursor_.bump();
                return ast_.add_expr(e);

            case K::kIntLit:
                e.kind = ast::ExprKind::kIntLit;
                if (const auto* v = std::get_if<int64_t>(&t.value)) e.int_value = *v;
                cursor_.bump();
                return ast_.add_expr(e);

            case K::kFloatLit:
                e.kind = ast::ExprKind::kFloatLit;
                if (const auto* v = std::get_if<double>(&t.value)) e.float_value = *v;
                cursor_.bump();
                return ast_.add_expr(e);

            case K::kStringLit:
                e.kind = ast::ExprKind::kStringLit;
                if (const auto* v = std::get_if<std::string>(&t.value)) {
                    e.string_value = ast_.add_owned_string(*v);
                }
                cursor_.bump();
                return ast_.add_expr(e);

            case K::kIdent:
                e.kind = ast::ExprKind::kIdent;
                cursor_.bump();
                return ast_.add_expr(e);

            case K::kLParen: {
                // 괄호식은 별도 노드를 만들지 않는다
                cursor_.bump();
                const ast::ExprId inner = parse_expr();
                if (!diag_expect(K::kRParen)) return error_expr(t.span);
                return inner;
            }

            case K::kLBracket: {
                const Token lb = cursor_.bump();
                return parse_expr_list_lit(lb);
            }

            case K::kEof:
                diag_report(diag::Code::kUnexpectedEof, t.span, "expression");
                return error_expr(t.span);

            default:
                diag_report(diag::Code::kExprExpected, t.span, describe(t));
                return error_expr(t.span);
        }
    }

    ast::ExprId Parser::parse_expr_list_lit(const Token& lbracket) {
        const auto [b, n] = parse_expr_list(K::kRBracket);
        if (aborted_) return error_expr(lbracket.span);

        ast::Expr e{};
        e.kind = ast::ExprKind::kListLit;
        e.arg_begin = b;
        e.arg_count = n;
        e.span = span_join(lbracket.span, cursor_.prev().span);
        return ast_.add_expr(e);
    }

    std::pair<uint32_t, uint32_t> Parser::parse_expr_list(K close) {
        std::vector<ast::ExprId> items;

        if (!cursor_.at(close)) {
            do {
                items.push_back(parse_expr());
                if (aborted_) return {0, 0};
            } while (cursor_.eat(K::kComma));
        }

        if (!diag_expect(close)) return {0, 0};

        // 중첩 호출의 인자가 섞이지 않도록 마지막에 커밋
        const uint32_t begin = static_cast<uint32_t>(ast_.expr_args().size());
        for (auto id : items) ast_.add_arg(id);
        return {begin, static_cast<uint32_t>(items.size())};
    }

} // namespace onec
