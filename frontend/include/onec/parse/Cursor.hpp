// frontend/include/onec/parse/Cursor.hpp
#pragma once
#include <onec/lex/Token.hpp>

#include <vector>


namespace onec {

    /// @brief 토큰 열 위의 읽기 커서. 마지막 토큰(EOF)을 넘어서 읽지 않는다.
    class Cursor {
    public:
        explicit Cursor(const std::vector<Token>& tokens) : tokens_(tokens) {}

        const Token& peek(size_t k = 0) const {
            size_t i = pos_ + k;
            if (i >= tokens_.size()) return tokens_.back();
            return tokens_[i];
        }

        bool at(syntax::TokenKind k) const {
            return peek().kind == k;
        }

        bool at_eof() const {
            return at(syntax::TokenKind::kEof);
        }

        bool eat(syntax::TokenKind k) {
            if (at(k)) { bump(); return true; }
            return false;
        }

        /// @brief 직전에 consume된 토큰
        const Token& prev() const {
            if (pos_ == 0) return peek();
            size_t i = pos_ - 1;
            if (i >= tokens_.size()) return tokens_.back();
            return tokens_[i];
        }

        const Token& bump() {
            // EOF에서는 전진하지 않는다
            if (pos_ + 1 >= tokens_.size()) return tokens_.back();
            return tokens_[pos_++];
        }

    private:
        const std::vector<Token>& tokens_;
        size_t pos_ = 0;
    };

} // namespace onec
