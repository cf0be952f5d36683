// frontend/src/parse/decl/parse_decl_fn.cpp
#include <onec/parse/Parser.hpp>

#include <string>


namespace onec {

    using K = syntax::TokenKind;

    ast::StmtId Parser::parse_program() {
        Span sp = cursor_.peek().span;
        sp.lo = 0;
        sp.hi = 0;
        sp.line = 1;
        sp.col = 1;

        std::vector<ast::StmtId> decls;

        skip_newlines();
        while (!aborted_ && !cursor_.at_eof()) {
            if (!cursor_.at(K::kKwFunction)) {
                // 최상위에는 function 선언만 허용
                const Token& t = cursor_.peek();
                diag_report(diag::Code::kDeclExpected, t.span, describe(t));
                break;
            }

            decls.push_back(parse_fn_decl());
            skip_newlines();
        }

        // children을 마지막에 한 번에 커밋 (slice 연속성 보장)
        ast::Stmt s{};
        s.kind = ast::StmtKind::kProgram;
        s.span = sp;
        s.stmt_begin = static_cast<uint32_t>(ast_.stmt_children().size());
        for (auto id : decls) ast_.add_stmt_child(id);
        s.stmt_count = static_cast<uint32_t>(decls.size());
        return ast_.add_stmt(s);
    }

    /// function NAME ':' [inputs: ...] [outputs: ...] [requirements: ...] implementation: Block
    ast::StmtId Parser::parse_fn_decl() {
        const Token kw = cursor_.bump(); // 'function'

        if (!cursor_.at(K::kIdent)) {
            diag_report(diag::Code::kFnNameExpected, cursor_.peek().span);
            return error_stmt(kw.span);
        }
        const Token name = cursor_.bump();

        ast::Stmt s{};
        s.kind = ast::StmtKind::kFnDecl;
        s.span = kw.span;
        s.name = name.lexeme;

        if (!diag_expect(K::kColon)) return error_stmt(kw.span);
        skip_newlines();

        if (cursor_.eat(K::kKwInputs)) {
            if (!diag_expect(K::kColon)) return error_stmt(kw.span);
            skip_newlines();
            const auto [b, n] = parse_param_list();
            s.input_begin = b;
            s.input_count = n;
            skip_newlines();
        }

        if (cursor_.eat(K::kKwOutputs)) {
            if (!diag_expect(K::kColon)) return error_stmt(kw.span);
            skip_newlines();
            const auto [b, n] = parse_param_list();
            s.output_begin = b;
            s.output_count = n;
            skip_newlines();
        }

        if (cursor_.eat(K::kKwRequirements)) {
            if (!diag_expect(K::kColon)) return error_stmt(kw.span);
            skip_newlines();
            const auto [b, n] = parse_requirement_list();
            s.req_begin = b;
            s.req_count = n;
            skip_newlines();
        }

        if (aborted_) return error_stmt(kw.span);

        if (!diag_expect(K::kKwImplementation)) return error_stmt(kw.span);
        if (!diag_expect(K::kColon)) return error_stmt(kw.span);
        skip_newlines();

        s.a = parse_block();
        if (aborted_) return error_stmt(kw.span);

        s.span = span_join(kw.span, ast_.stmt(s.a).span);
        return ast_.add_stmt(s);
    }

    std::pair<uint32_t, uint32_t> Parser::parse_param_list() {
        std::vector<ast::Param> ps;

        while (!aborted_ && !cursor_.at_eof() && !is_section_keyword(cursor_.peek().kind)) {
            if (cursor_.at(K::kNewline)) {
                skip_newlines();
                if (!cursor_.at(K::kIdent)) break;
            }

            ps.push_back(parse_param());
            if (aborted_) break;

            // 파라미터는 NEWLINE으로 구분된다
            if (!cursor_.eat(K::kNewline)) break;
        }

        const uint32_t begin = static_cast<uint32_t>(ast_.params().size());
        for (const auto& p : ps) ast_.add_param(p);
        return {begin, static_cast<uint32_t>(ps.size())};
    }

    ast::Param Parser::parse_param() {
        ast::Param p{};

        const Token& t = cursor_.peek();
        if (!cursor_.at(K::kIdent)) {
            diag_report(diag::Code::kParamNameExpected, t.span, describe(t));
            return p;
        }

        const Token name = cursor_.bump();
        p.name = name.lexeme;
        p.span = name.span;

        if (cursor_.eat(K::kColon)) {
            p.type = parse_type_ann();
            if (!aborted_ && pending_gt_ != 0) {
                diag_report(diag::Code::kUnexpectedToken, cursor_.prev().span, ">");
            }
        }
        return p;
    }

    bool Parser::expect_type_close() {
        if (pending_gt_ != 0) {
            --pending_gt_;
            return true;
        }
        if (cursor_.eat(K::kGt)) return true;
        if (cursor_.at(K::kShiftRight)) {
            cursor_.bump();
            pending_gt_ = 1;
            return true;
        }
        return diag_expect(K::kGt);
    }

    ast::TypeAnnId Parser::parse_type_ann() {
        const Token& t = cursor_.peek();
        if (!cursor_.at(K::kIdent)) {
            diag_report(diag::Code::kTypeNameExpected, t.span, describe(t));
            return ast::k_invalid_type_ann;
        }

        const Token name = cursor_.bump();

        ast::TypeAnn ta{};
        ta.name = name.lexeme;
        ta.span = name.span;

        std::vector<ast::TypeAnnId> args;
        if (cursor_.eat(K::kLt)) {
            do {
                args.push_back(parse_type_ann());
                if (aborted_) return ast::k_invalid_type_ann;
            } while (pending_gt_ == 0 && cursor_.eat(K::kComma));

            if (!expect_type_close()) return ast::k_invalid_type_ann;
        }

        // where 절은 인식만 하고 내용은 버린다
        if (cursor_.at(K::kKwWhere)) skip_where_clause();

        ta.arg_begin = static_cast<uint32_t>(ast_.type_ann_args().size());
        for (auto a : args) ast_.add_type_ann_arg(a);
        ta.arg_count = static_cast<uint32_t>(args.size());
        return ast_.add_type_ann(ta);
    }

    void Parser::skip_where_clause() {
        while (!cursor_.at_eof() && !cursor_.at(K::kNewline)) cursor_.bump();
    }

    std::pair<uint32_t, uint32_t> Parser::parse_requirement_list() {
        std::vector<ast::Requirement> reqs;

        while (!aborted_ && !cursor_.at_eof() && !cursor_.at(K::kKwImplementation)) {
            if (cursor_.at(K::kNewline)) {
                skip_newlines();
                if (!cursor_.at(K::kMinus)) break;
            }
            if (!cursor_.at(K::kMinus)) break;

            const Token dash = cursor_.bump();

            // '-' 뒤의 줄 끝까지의 lexeme들을 공백으로 잇는다
            std::string desc;
            while (!cursor_.at_eof() && !cursor_.at(K::kNewline)) {
                if (!desc.empty()) desc.push_back(' ');
                desc += cursor_.bump().lexeme;
            }

            ast::Requirement r{};
            r.text = ast_.add_owned_string(std::move(desc));
            r.span = dash.span;
            reqs.push_back(r);
        }

        const uint32_t begin = static_cast<uint32_t>(ast_.requirements().size());
        for (const auto& r : reqs) ast_.add_requirement(r);
        return {begin, static_cast<uint32_t>(reqs.size())};
    }

} // namespace onec
