// frontend/include/onec/lex/Token.hpp
#pragma once
#include <onec/syntax/TokenKind.hpp>
#include <onec/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>


namespace onec {

    /// @brief lexer가 디코딩한 리터럴 값. null과 "값 없음"은 monostate.
    using LitValue = std::variant<std::monostate, int64_t, double, bool, std::string>;

    struct Token {
        syntax::TokenKind kind = syntax::TokenKind::kError;
        Span span{};
        std::string_view lexeme{};  // source_ 원문을 가리킨다
        LitValue value{};
    };

} // namespace onec
