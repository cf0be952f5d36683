// frontend/include/onec/syntax/Keywords.hpp
#pragma once
#include <onec/syntax/TokenKind.hpp>

#include <array>
#include <string_view>


namespace onec::syntax {

    struct KeywordEntry {
        std::string_view text;
        TokenKind kind;
    };

    // 프로세스 전역 불변 테이블. 초기화 순서 의존성 없음.
    inline constexpr std::array<KeywordEntry, 35> k_keyword_table = {{
        {"function",       TokenKind::kKwFunction},
        {"type",           TokenKind::kKwType},
        {"module",         TokenKind::kKwModule},
        {"import",         TokenKind::kKwImport},
        {"export",         TokenKind::kKwExport},
        {"inputs",         TokenKind::kKwInputs},
        {"outputs",        TokenKind::kKwOutputs},
        {"requirements",   TokenKind::kKwRequirements},
        {"implementation", TokenKind::kKwImplementation},
        {"where",          TokenKind::kKwWhere},
        {"invariant",      TokenKind::kKwInvariant},
        {"ensure",         TokenKind::kKwEnsure},
        {"otherwise",      TokenKind::kKwOtherwise},
        {"match",          TokenKind::kKwMatch},
        {"if",             TokenKind::kKwIf},
        {"else",           TokenKind::kKwElse},
        {"loop",           TokenKind::kKwLoop},
        {"while",          TokenKind::kKwWhile},
        {"for",            TokenKind::kKwFor},
        {"in",             TokenKind::kKwIn},
        {"return",         TokenKind::kKwReturn},
        {"break",          TokenKind::kKwBreak},
        {"continue",       TokenKind::kKwContinue},
        {"const",          TokenKind::kKwConst},
        {"let",            TokenKind::kKwLet},
        {"var",            TokenKind::kKwVar},
        {"true",           TokenKind::kKwTrue},
        {"false",          TokenKind::kKwFalse},
        {"null",           TokenKind::kKwNull},
        {"and",            TokenKind::kKwAnd},
        {"or",             TokenKind::kKwOr},
        {"not",            TokenKind::kKwNot},
        {"syntax",         TokenKind::kKwSyntax},
        {"with_syntax",    TokenKind::kKwWithSyntax},
        {"use_syntax",     TokenKind::kKwUseSyntax},
    }};

    /// @brief 식별자 텍스트를 키워드로 분류. 키워드가 아니면 kIdent.
    constexpr TokenKind keyword_or_ident(std::string_view text) {
        for (const auto& e : k_keyword_table) {
            if (e.text == text) return e.kind;
        }
        return TokenKind::kIdent;
    }

} // namespace onec::syntax
