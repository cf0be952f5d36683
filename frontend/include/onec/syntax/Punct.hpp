// frontend/include/onec/syntax/Punct.hpp
#pragma once
#include <onec/syntax/TokenKind.hpp>

#include <array>
#include <string_view>


namespace onec::syntax {

    // Maximal munch: longer punctuations first.
    struct PunctEntry {
        std::string_view text;
        TokenKind kind;
    };

    inline constexpr std::array<PunctEntry, 36> k_punct_table = {{
        {"==", TokenKind::kEqEq},
        {"!=", TokenKind::kBangEq},
        {"<=", TokenKind::kLtEq},
        {">=", TokenKind::kGtEq},
        {"<<", TokenKind::kShiftLeft},
        {">>", TokenKind::kShiftRight},
        {"+=", TokenKind::kPlusAssign},
        {"-=", TokenKind::kMinusAssign},
        // "*="는 "**"보다 먼저 본다
        {"*=", TokenKind::kStarAssign},
        {"/=", TokenKind::kSlashAssign},
        {"->", TokenKind::kArrow},
        {"=>", TokenKind::kFatArrow},
        {"**", TokenKind::kStarStar},

        {"+",  TokenKind::kPlus},
        {"-",  TokenKind::kMinus},
        {"*",  TokenKind::kStar},
        {"/",  TokenKind::kSlash},
        {"%",  TokenKind::kPercent},
        {"<",  TokenKind::kLt},
        {">",  TokenKind::kGt},
        {"=",  TokenKind::kAssign},
        {"&",  TokenKind::kAmp},
        {"|",  TokenKind::kPipe},
        {"^",  TokenKind::kCaret},
        {"~",  TokenKind::kTilde},

        {"(",  TokenKind::kLParen},
        {")",  TokenKind::kRParen},
        {"{",  TokenKind::kLBrace},
        {"}",  TokenKind::kRBrace},
        {"[",  TokenKind::kLBracket},
        {"]",  TokenKind::kRBracket},
        {",",  TokenKind::kComma},
        {":",  TokenKind::kColon},
        {";",  TokenKind::kSemicolon},
        {".",  TokenKind::kDot},
        {"?",  TokenKind::kQuestion},
    }};

} // namespace onec::syntax
