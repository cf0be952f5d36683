// tools/onec/src/dump/Dump.cpp
#include "Dump.hpp"

#include <onec/syntax/TokenKind.hpp>


namespace onec::dump {

    static const char* expr_kind_name(ast::ExprKind k) {
        using K = ast::ExprKind;
        switch (k) {
            case K::kError: return "Error";
            case K::kIntLit: return "IntLit";
            case K::kFloatLit: return "FloatLit";
            case K::kStringLit: return "StringLit";
            case K::kBoolLit: return "BoolLit";
            case K::kNullLit: return "NullLit";
            case K::kIdent: return "Ident";
            case K::kUnary: return "Unary";
            case K::kBinary: return "Binary";
            case K::kCall: return "Call";
            case K::kMember: return "Member";
            case K::kIndex: return "Index";
            case K::kListLit: return "ListLit";
        }
        return "Unknown";
    }

    static const char* stmt_kind_name(ast::StmtKind k) {
        using K = ast::StmtKind;
        switch (k) {
            case K::kError: return "Error";
            case K::kProgram: return "Program";
            case K::kFnDecl: return "FnDecl";
            case K::kBlock: return "Block";
            case K::kExprStmt: return "ExprStmt";
            case K::kAssign: return "Assign";
            case K::kReturn: return "Return";
            case K::kIf: return "If";
            case K::kEnsure: return "Ensure";
            case K::kWhile: return "While";
            case K::kBreak: return "Break";
            case K::kContinue: return "Continue";
        }
        return "Unknown";
    }

    static void indent_(std::ostream& os, int indent) {
        for (int i = 0; i < indent; ++i) os << "  ";
    }

    static void dump_type_ann_(std::ostream& os, const ast::AstArena& ast, ast::TypeAnnId id) {
        if (id == ast::k_invalid_type_ann) {
            os << "<none>";
            return;
        }
        const auto& t = ast.type_anns()[id];
        os << t.name;
        if (t.arg_count == 0) return;

        os << "<";
        for (uint32_t i = 0; i < t.arg_count; ++i) {
            if (i) os << ", ";
            dump_type_ann_(os, ast, ast.type_ann_args()[t.arg_begin + i]);
        }
        os << ">";
    }

    void dump_tokens(std::ostream& os, const std::vector<Token>& tokens) {
        os << "TOKENS:\n";
        for (const auto& t : tokens) {
            os << "  " << syntax::token_kind_name(t.kind);
            if (t.kind != syntax::TokenKind::kNewline && t.kind != syntax::TokenKind::kEof) {
                os << " '" << t.lexeme << "'";
            }
            os << " @" << t.span.line << ":" << t.span.col << "\n";
        }
    }

    void dump_expr(std::ostream& os, const ast::AstArena& ast, ast::ExprId id, int indent) {
        indent_(os, indent);
        if (id == ast::k_invalid_expr) {
            os << "<null>\n";
            return;
        }

        const auto& e = ast.expr(id);
        os << expr_kind_name(e.kind);

        if (e.op != syntax::TokenKind::kError) {
            os << " op=" << syntax::token_kind_name(e.op);
        }
        if (!e.text.empty()) {
            os << " text=" << e.text;
        }
        os << " @" << e.span.line << ":" << e.span.col << "\n";

        switch (e.kind) {
            case ast::ExprKind::kUnary:
            case ast::ExprKind::kMember:
                dump_expr(os, ast, e.a, indent + 1);
                break;

            case ast::ExprKind::kBinary:
            case ast::ExprKind::kIndex:
                dump_expr(os, ast, e.a, indent + 1);
                dump_expr(os, ast, e.b, indent + 1);
                break;

            case ast::ExprKind::kCall:
                dump_expr(os, ast, e.a, indent + 1);
                for (uint32_t i = 0; i < e.arg_count; ++i) {
                    dump_expr(os, ast, ast.expr_args()[e.arg_begin + i], indent + 2);
                }
                break;

            case ast::ExprKind::kListLit:
                for (uint32_t i = 0; i < e.arg_count; ++i) {
                    dump_expr(os, ast, ast.expr_args()[e.arg_begin + i], indent + 1);
                }
                break;

            default:
                break;
        }
    }

    void dump_stmt(std::ostream& os, const ast::AstArena& ast, ast::StmtId id, int indent) {
        indent_(os, indent);
        if (id == ast::k_invalid_stmt) {
            os << "<null>\n";
            return;
        }

        const auto& s = ast.stmt(id);
        os << stmt_kind_name(s.kind);

        if (s.kind == ast::StmtKind::kFnDecl) {
            os << " name=" << s.name;
        }
        if (s.kind == ast::StmtKind::kAssign) {
            os << " op=" << syntax::token_kind_name(s.op);
        }
        os << " @" << s.span.line << ":" << s.span.col << "\n";

        switch (s.kind) {
            case ast::StmtKind::kProgram:
            case ast::StmtKind::kBlock:
                for (uint32_t i = 0; i < s.stmt_count; ++i) {
                    dump_stmt(os, ast, ast.stmt_children()[s.stmt_begin + i], indent + 1);
                }
                break;

            case ast::StmtKind::kFnDecl:
                for (uint32_t i = 0; i < s.input_count; ++i) {
                    const auto& p = ast.params()[s.input_begin + i];
                    indent_(os, indent + 1);
                    os << "Input " << p.name << ": ";
                    dump_type_ann_(os, ast, p.type);
                    os << "\n";
                }
                for (uint32_t i = 0; i < s.output_count; ++i) {
                    const auto& p = ast.params()[s.output_begin + i];
                    indent_(os, indent + 1);
                    os << "Output " << p.name << ": ";
                    dump_type_ann_(os, ast, p.type);
                    os << "\n";
                }
                for (uint32_t i = 0; i < s.req_count; ++i) {
                    indent_(os, indent + 1);
                    os << "Requires: " << ast.requirements()[s.req_begin + i].text << "\n";
                }
                dump_stmt(os, ast, s.a, indent + 1);
                break;

            case ast::StmtKind::kExprStmt:
            case ast::StmtKind::kReturn:
                if (s.expr != ast::k_invalid_expr) dump_expr(os, ast, s.expr, indent + 1);
                break;

            case ast::StmtKind::kAssign:
                indent_(os, indent + 1);
                os << "Target:\n";
                dump_expr(os, ast, s.target, indent + 2);
                indent_(os, indent + 1);
                os << "Value:\n";
                dump_expr(os, ast, s.expr, indent + 2);
                break;

            case ast::StmtKind::kIf:
            case ast::StmtKind::kEnsure:
            case ast::StmtKind::kWhile:
                indent_(os, indent + 1);
                os << "Cond:\n";
                dump_expr(os, ast, s.expr, indent + 2);

                indent_(os, indent + 1);
                os << (s.kind == ast::StmtKind::kWhile ? "Body:\n" : "Then:\n");
                dump_stmt(os, ast, s.a, indent + 2);

                if (s.b != ast::k_invalid_stmt) {
                    indent_(os, indent + 1);
                    os << (s.kind == ast::StmtKind::kEnsure ? "Otherwise:\n" : "Else:\n");
                    dump_stmt(os, ast, s.b, indent + 2);
                }
                break;

            default:
                break;
        }
    }

} // namespace onec::dump
