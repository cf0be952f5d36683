// frontend/include/onec/syntax/TokenKind.hpp
#pragma once
#include <string_view>
#include <cstdint>


namespace onec::syntax {

    enum class TokenKind : uint16_t {
        // special
        kEof = 0,
        kError,
        kNewline,     // 문장/파라미터 구분자. 건너뛰지 않는다.

        // identifiers / literals
        kIdent,
        kIntLit,
        kFloatLit,
        kStringLit,

        // declaration keywords
        kKwFunction,
        kKwType,
        kKwModule,
        kKwImport,
        kKwExport,
        kKwInputs,
        kKwOutputs,
        kKwRequirements,
        kKwImplementation,
        kKwWhere,
        kKwInvariant,

        // stmt keywords
        kKwEnsure,
        kKwOtherwise,
        kKwMatch,
        kKwIf,
        kKwElse,
        kKwLoop,
        kKwWhile,
        kKwFor,
        kKwIn,
        kKwReturn,
        kKwBreak,
        kKwContinue,
        kKwConst,
        kKwLet,
        kKwVar,

        // literal keywords
        kKwTrue,
        kKwFalse,
        kKwNull,

        // logical keywords
        kKwAnd,
        kKwOr,
        kKwNot,

        // syntax extension hooks (parsed nowhere yet)
        kKwSyntax,
        kKwWithSyntax,
        kKwUseSyntax,

        // two-char operators
        kEqEq,
        kBangEq,
        kLtEq,
        kGtEq,
        kShiftLeft,
        kShiftRight,
        kPlusAssign,
        kMinusAssign,
        kStarAssign,
        kSlashAssign,
        kArrow,       // ->
        kFatArrow,    // =>
        kStarStar,    // ** (lexed, never parsed)

        // single-char operators
        kPlus,
        kMinus,
        kStar,
        kSlash,
        kPercent,
        kLt,
        kGt,
        kAssign,
        kAmp,
        kPipe,
        kCaret,
        kTilde,

        // punctuation
        kLParen,
        kRParen,
        kLBrace,
        kRBrace,
        kLBracket,
        kRBracket,
        kComma,
        kColon,
        kSemicolon,
        kDot,
        kQuestion,
    };

    constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kEof: return "eof";
            case TokenKind::kError: return "error";
            case TokenKind::kNewline: return "newline";

            case TokenKind::kIdent: return "ident";
            case TokenKind::kIntLit: return "int_lit";
            case TokenKind::kFloatLit: return "float_lit";
            case TokenKind::kStringLit: return "string_lit";

            case TokenKind::kKwFunction: return "function";
            case TokenKind::kKwType: return "type";
            case TokenKind::kKwModule: return "module";
            case TokenKind::kKwImport: return "import";
            case TokenKind::kKwExport: return "export";
            case TokenKind::kKwInputs: return "inputs";
            case TokenKind::kKwOutputs: return "outputs";
            case TokenKind::kKwRequirements: return "requirements";
            case TokenKind::kKwImplementation: return "implementation";
            case TokenKind::kKwWhere: return "where";
            case TokenKind::kKwInvariant: return "invariant";

            case TokenKind::kKwEnsure: return "ensure";
            case TokenKind::kKwOtherwise: return "otherwise";
            case TokenKind::kKwMatch: return "match";
            case TokenKind::kKwIf: return "if";
            case TokenKind::kKwElse: return "else";
            case TokenKind::kKwLoop: return "loop";
            case TokenKind::kKwWhile: return "while";
            case TokenKind::kKwFor: return "for";
            case TokenKind::kKwIn: return "in";
            case TokenKind::kKwReturn: return "return";
            case TokenKind::kKwBreak: return "break";
            case TokenKind::kKwContinue: return "continue";
            case TokenKind::kKwConst: return "const";
            case TokenKind::kKwLet: return "let";
            case TokenKind::kKwVar: return "var";

            case TokenKind::kKwTrue: return "true";
            case TokenKind::kKwFalse: return "false";
            case TokenKind::kKwNull: return "null";

            case TokenKind::kKwAnd: return "and";
            case TokenKind::kKwOr: return "or";
            case TokenKind::kKwNot: return "not";

            case TokenKind::kKwSyntax: return "syntax";
            case TokenKind::kKwWithSyntax: return "with_syntax";
            case TokenKind::kKwUseSyntax: return "use_syntax";

            case TokenKind::kEqEq: return "==";
            case TokenKind::kBangEq: return "!=";
            case TokenKind::kLtEq: return "<=";
            case TokenKind::kGtEq: return ">=";
            case TokenKind::kShiftLeft: return "<<";
            case TokenKind::kShiftRight: return ">>";
            case TokenKind::kPlusAssign: return "+=";
            case TokenKind::kMinusAssign: return "-=";
            case TokenKind::kStarAssign: return "*=";
            case TokenKind::kSlashAssign: return "/=";
            case TokenKind::kArrow: return "->";
            case TokenKind::kFatArrow: return "=>";
            case TokenKind::kStarStar: return "**";

            case TokenKind::kPlus: return "+";
            case TokenKind::kMinus: return "-";
            case TokenKind::kStar: return "*";
            case TokenKind::kSlash: return "/";
            case TokenKind::kPercent: return "%";
            case TokenKind::kLt: return "<";
            case TokenKind::kGt: return ">";
            case TokenKind::kAssign: return "=";
            case TokenKind::kAmp: return "&";
            case TokenKind::kPipe: return "|";
            case TokenKind::kCaret: return "^";
            case TokenKind::kTilde: return "~";

            case TokenKind::kLParen: return "(";
            case TokenKind::kRParen: return ")";
            case TokenKind::kLBrace: return "{";
            case TokenKind::kRBrace: return "}";
            case TokenKind::kLBracket: return "[";
            case TokenKind::kRBracket: return "]";
            case TokenKind::kComma: return ",";
            case TokenKind::kColon: return ":";
            case TokenKind::kSemicolon: return ";";
            case TokenKind::kDot: return ".";
            case TokenKind::kQuestion: return "?";
        }
        return "unknown";
    }

    /// @brief 할당 연산자(= += -= *= /=)인지 판정
    constexpr bool is_assign_op(TokenKind k) {
        return k == TokenKind::kAssign
            || k == TokenKind::kPlusAssign
            || k == TokenKind::kMinusAssign
            || k == TokenKind::kStarAssign
            || k == TokenKind::kSlashAssign;
    }

} // namespace onec::syntax
