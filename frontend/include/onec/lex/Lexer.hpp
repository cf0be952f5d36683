// frontend/include/onec/lex/Lexer.hpp
#pragma once
#include <onec/lex/Token.hpp>
#include <onec/diag/Diagnostic.hpp>

#include <string_view>
#include <vector>


namespace onec {

    /// @brief 소스 텍스트를 위치 정보가 붙은 토큰 열로 변환한다.
    /// @details 첫 에러에서 중단한다(fail-fast). 에러 시 diags에 진단이 남고
    ///          반환되는 토큰 열은 그때까지의 토큰 + EOF 이다.
    class Lexer {
    public:
        Lexer(std::string_view source, uint32_t file_id)
            : Lexer(source, file_id, nullptr) {}

        Lexer(std::string_view source, uint32_t file_id, diag::Bag* diags);

        std::vector<Token> lex_all();

        bool failed() const { return failed_; }

    private:
        char peek(size_t k = 0) const;
        bool eof() const;
        char bump();

        // 현재 위치의 span 시작점 (hi는 호출자가 채움)
        Span mark() const;
        Token finish(syntax::TokenKind kind, Span sp) const;

        void skip_ws_and_comments();

        Token lex_number();
        Token lex_ident_or_kw();
        Token lex_string();
        Token lex_punct_or_unknown();

        void emit_eof(std::vector<Token>& out);

        void report(diag::Code code, Span sp, std::string_view a0 = {});

        std::string_view source_;
        uint32_t file_id_ = 0;
        size_t pos_ = 0;
        uint32_t line_ = 1;
        uint32_t col_ = 1;

        bool failed_ = false;
        diag::Bag* diags_ = nullptr;
    };

    /// @brief 편의 함수: 토큰화 후 에러가 있으면 false.
    bool tokenize(std::string_view source, uint32_t file_id, diag::Bag& diags, std::vector<Token>& out);

} // namespace onec
