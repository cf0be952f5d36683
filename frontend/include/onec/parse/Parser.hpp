// frontend/include/onec/parse/Parser.hpp
#pragma once
#include <onec/parse/Cursor.hpp>
#include <onec/ast/Nodes.hpp>
#include <onec/diag/Diagnostic.hpp>

#include <string_view>
#include <utility>
#include <vector>


namespace onec {

    /// @brief 재귀 하강 파서. 첫 문법 오류에서 중단한다(오류 복구 없음).
    class Parser {
    public:
        Parser(const std::vector<Token>& tokens,
               ast::AstArena& ast,
               diag::Bag* diags = nullptr)
            : cursor_(tokens), ast_(ast), diags_(diags) {}

        // EOF까지 function 선언을 반복 파싱하여 Program 노드 생성
        ast::StmtId parse_program();

        // 표현식 1개를 파싱 (도구/테스트용)
        ast::ExprId parse_expr();

        // 문장 1개를 파싱 (도구/테스트용)
        ast::StmtId parse_stmt();

        bool is_aborted() const { return aborted_; }

    private:
        // --------------------
        // diag & small helpers
        // --------------------

        //  첫 진단을 기록하고 중단 상태로 전환
        void diag_report(diag::Code code, Span span, std::string_view a0 = {}, std::string_view a1 = {});

        //  토큰 1개를 기대하고 소비, 실패 시 진단
        bool diag_expect(syntax::TokenKind k);

        //  현재 토큰의 표시용 텍스트
        std::string_view describe(const Token& t) const;

        void skip_newlines();

        //  NEWLINE을 건너뛴 뒤의 토큰이 k인지 (소비하지 않음)
        bool at_after_newlines(syntax::TokenKind k) const;

        bool is_section_keyword(syntax::TokenKind k) const;

        ast::ExprId error_expr(Span sp);
        ast::StmtId error_stmt(Span sp);

        // --------------------
        // decl
        // --------------------

        ast::StmtId parse_fn_decl();

        // (begin, count) in arena.params
        std::pair<uint32_t, uint32_t> parse_param_list();
        ast::Param parse_param();
        ast::TypeAnnId parse_type_ann();
        //  '>' 1개를 기대. '>>'는 둘로 나눠 바깥 인자 목록에 하나를 넘긴다.
        bool expect_type_close();
        void skip_where_clause();

        // (begin, count) in arena.requirements
        std::pair<uint32_t, uint32_t> parse_requirement_list();

        // --------------------
        // stmt
        // --------------------

        //  '{ ... }' 또는 들여쓰기 암시 블록. 첫 토큰으로 형태를 결정한다.
        ast::StmtId parse_block();
        ast::StmtId parse_block_brace();
        ast::StmtId parse_block_implied();

        ast::StmtId parse_stmt_any();
        ast::StmtId parse_stmt_return();
        ast::StmtId parse_stmt_cond(ast::StmtKind kind);   // if / ensure
        ast::StmtId parse_stmt_while();
        ast::StmtId parse_stmt_expr_or_assign();

        // --------------------
        // expr
        // --------------------

        //  이항 연산 precedence climbing (모두 좌결합)
        ast::ExprId parse_expr_binary(int min_prec);
        ast::ExprId parse_expr_unary();
        ast::ExprId parse_expr_postfix(ast::ExprId base);
        ast::ExprId parse_expr_primary();
        ast::ExprId parse_expr_list_lit(const Token& lbracket);

        //  ',' 구분 표현식 목록을 close까지 파싱하고 expr_args에 커밋
        std::pair<uint32_t, uint32_t> parse_expr_list(syntax::TokenKind close);

        static int infix_prec(syntax::TokenKind k);

        Cursor cursor_;
        ast::AstArena& ast_;
        diag::Bag* diags_ = nullptr;

        bool aborted_ = false;
        uint32_t pending_gt_ = 0;
    };

} // namespace onec
