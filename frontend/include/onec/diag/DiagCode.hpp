// frontend/include/onec/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace onec::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kFatal,
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    /// @brief 진단을 만든 파이프라인 단계. 네 종류의 에러는 서로 겹치지 않는다.
    enum class Stage : uint8_t {
        kLex,
        kParse,
        kTypeCheck,
        kCodegen,
    };

    enum class Code : uint16_t {
        // ---- lex ----
        kUnterminatedString,        // opening quote location
        kUnterminatedBlockComment,  // end-of-input location
        kUnknownEscape,             // args: escape char
        kUnexpectedChar,            // args: char
        kIntLiteralOutOfRange,      // args: literal text

        // ---- parse ----
        kExpectedToken,             // args: expected, got
        kUnexpectedToken,           // args: got
        kUnexpectedEof,             // args: expected
        kDeclExpected,              // args: got (only 'function' at top level)
        kFnNameExpected,
        kParamNameExpected,         // args: got
        kTypeNameExpected,          // args: got
        kExprExpected,              // args: got

        // ---- type check ----
        kUndefinedVariable,         // args: name

        // ---- codegen ----
        kBreakOutsideLoop,
        kContinueOutsideLoop,
        kUnsupportedOperator,       // args: operator spelling
        kCallTargetNotIdentifier,
        kAssignTargetNotIdentifier, // args: assignment operator
        kDuplicateFunction,         // warning, args: name
    };

    constexpr Stage stage_of(Code c) {
        switch (c) {
            case Code::kUnterminatedString:
            case Code::kUnterminatedBlockComment:
            case Code::kUnknownEscape:
            case Code::kUnexpectedChar:
            case Code::kIntLiteralOutOfRange:
                return Stage::kLex;

            case Code::kExpectedToken:
            case Code::kUnexpectedToken:
            case Code::kUnexpectedEof:
            case Code::kDeclExpected:
            case Code::kFnNameExpected:
            case Code::kParamNameExpected:
            case Code::kTypeNameExpected:
            case Code::kExprExpected:
                return Stage::kParse;

            case Code::kUndefinedVariable:
                return Stage::kTypeCheck;

            case Code::kBreakOutsideLoop:
            case Code::kContinueOutsideLoop:
            case Code::kUnsupportedOperator:
            case Code::kCallTargetNotIdentifier:
            case Code::kAssignTargetNotIdentifier:
            case Code::kDuplicateFunction:
                return Stage::kCodegen;
        }
        return Stage::kCodegen;
    }

    constexpr const char* stage_name(Stage s) {
        switch (s) {
            case Stage::kLex: return "LexError";
            case Stage::kParse: return "ParseError";
            case Stage::kTypeCheck: return "TypeCheckError";
            case Stage::kCodegen: return "CodeGenError";
        }
        return "Error";
    }

} // namespace onec::diag
