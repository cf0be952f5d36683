// frontend/src/diag/render.cpp
#include <onec/diag/Render.hpp>

#include <sstream>


namespace onec::diag {

    static constexpr uint32_t digits10(uint32_t v) {
        uint32_t d = 1;
        while (v >= 10) { v /= 10; ++d; }
        return d;
    }

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    static std::string_view code_name_sv_(Code c) {
        switch (c) {
            case Code::kUnterminatedString: return "UnterminatedString";
            case Code::kUnterminatedBlockComment: return "UnterminatedBlockComment";
            case Code::kUnknownEscape: return "UnknownEscape";
            case Code::kUnexpectedChar: return "UnexpectedChar";
            case Code::kIntLiteralOutOfRange: return "IntLiteralOutOfRange";

            case Code::kExpectedToken: return "ExpectedToken";
            case Code::kUnexpectedToken: return "UnexpectedToken";
            case Code::kUnexpectedEof: return "UnexpectedEof";
            case Code::kDeclExpected: return "DeclExpected";
            case Code::kFnNameExpected: return "FnNameExpected";
            case Code::kParamNameExpected: return "ParamNameExpected";
            case Code::kTypeNameExpected: return "TypeNameExpected";
            case Code::kExprExpected: return "ExprExpected";

            case Code::kUndefinedVariable: return "UndefinedVariable";

            case Code::kBreakOutsideLoop: return "BreakOutsideLoop";
            case Code::kContinueOutsideLoop: return "ContinueOutsideLoop";
            case Code::kUnsupportedOperator: return "UnsupportedOperator";
            case Code::kCallTargetNotIdentifier: return "CallTargetNotIdentifier";
            case Code::kAssignTargetNotIdentifier: return "AssignTargetNotIdentifier";
            case Code::kDuplicateFunction: return "DuplicateFunction";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            case Code::kUnterminatedString: return "Unterminated string";
            case Code::kUnterminatedBlockComment: return "Unterminated block comment";
            case Code::kUnknownEscape: return "Unknown escape sequence: \\{0}";
            case Code::kUnexpectedChar: return "Unexpected character: '{0}'";
            case Code::kIntLiteralOutOfRange: return "Integer literal out of range: {0}";

            case Code::kExpectedToken: return "Expected {0}, got {1}";
            case Code::kUnexpectedToken: return "Unexpected token: {0}";
            case Code::kUnexpectedEof: return "Unexpected end of input, expected {0}";
            case Code::kDeclExpected: return "Expected declaration, got {0}";
            case Code::kFnNameExpected: return "Expected function name";
            case Code::kParamNameExpected: return "Expected parameter name, got {0}";
            case Code::kTypeNameExpected: return "Expected type name, got {0}";
            case Code::kExprExpected: return "Unexpected token: {0}";

            case Code::kUndefinedVariable: return "Undefined variable: {0}";

            case Code::kBreakOutsideLoop: return "Break outside loop";
            case Code::kContinueOutsideLoop: return "Continue outside loop";
            case Code::kUnsupportedOperator: return "Unknown operator: {0}";
            case Code::kCallTargetNotIdentifier: return "Complex function calls not yet supported";
            case Code::kAssignTargetNotIdentifier: return "Assignment '{0}' requires a simple variable target";
            case Code::kDuplicateFunction: return "Function '{0}' is defined more than once; the last definition wins";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kUnterminatedString: return "문자열이 닫히지 않았습니다";
            case Code::kUnterminatedBlockComment: return "블록 주석이 닫히지 않았습니다";
            case Code::kUnknownEscape: return "알 수 없는 이스케이프 시퀀스입니다: \\{0}";
            case Code::kUnexpectedChar: return "예상하지 못한 문자입니다: '{0}'";
            case Code::kIntLiteralOutOfRange: return "정수 리터럴이 범위를 벗어났습니다: {0}";

            case Code::kExpectedToken: return "{0}이(가) 필요하지만 {1}을(를) 만났습니다";
            case Code::kUnexpectedToken: return "예상하지 못한 토큰입니다: {0}";
            case Code::kUnexpectedEof: return "입력이 끝났습니다. {0}이(가) 필요합니다";
            case Code::kDeclExpected: return "선언이 필요하지만 {0}을(를) 만났습니다";
            case Code::kFnNameExpected: return "함수 이름이 필요합니다";
            case Code::kParamNameExpected: return "파라미터 이름이 필요하지만 {0}을(를) 만났습니다";
            case Code::kTypeNameExpected: return "타입 이름이 필요하지만 {0}을(를) 만났습니다";
            case Code::kExprExpected: return "예상하지 못한 토큰입니다: {0}";

            case Code::kUndefinedVariable: return "정의되지 않은 변수입니다: {0}";

            case Code::kBreakOutsideLoop: return "루프 밖에서 break를 사용할 수 없습니다";
            case Code::kContinueOutsideLoop: return "루프 밖에서 continue를 사용할 수 없습니다";
            case Code::kUnsupportedOperator: return "알 수 없는 연산자입니다: {0}";
            case Code::kCallTargetNotIdentifier: return "호출 대상은 단순 이름이어야 합니다";
            case Code::kAssignTargetNotIdentifier: return "'{0}' 할당의 대상은 단순 변수여야 합니다";
            case Code::kDuplicateFunction: return "함수 '{0}'이(가) 여러 번 정의되었습니다. 마지막 정의가 사용됩니다";
        }
        return "알 수 없는 진단";
    }

    static const char* severity_name_(Severity sev) {
        return (sev == Severity::kWarning) ? "warning" :
               (sev == Severity::kFatal)   ? "fatal"   : "error";
    }

    std::string code_name(Code c) {
        return std::string(code_name_sv_(c));
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    std::string render_location(const Diagnostic& d, const SourceManager& sm) {
        return sm.location_string(d.span());
    }

    std::string render_brief(const Diagnostic& d, Language lang, const SourceManager& sm) {
        std::string out = stage_name(d.stage());
        out += ": ";
        out += render_message(d, lang);
        out += " at ";
        out += render_location(d, sm);
        return out;
    }

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm) {
        const std::string msg = render_message(d, lang);
        const auto sn = sm.snippet_for_span(d.span());

        std::ostringstream oss;
        oss << severity_name_(d.severity()) << "[" << code_name_sv_(d.code()) << "]: " << msg << "\n";
        oss << " --> " << render_location(d, sm) << "\n";
        oss << "  |\n";
        oss << sn.line_no << " | " << sn.line_text << "\n";
        oss << "  | ";
        for (uint32_t i = 0; i < sn.caret_cols_before; ++i) oss << ' ';
        for (uint32_t i = 0; i < sn.caret_cols_len; ++i) oss << '^';

        return oss.str();
    }

    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines) {
        const std::string msg = render_message(d, lang);

        // 컨텍스트 스니펫
        const auto blk = sm.snippet_block_for_span(d.span(), context_lines);

        std::ostringstream out;
        out << severity_name_(d.severity()) << "[" << code_name_sv_(d.code()) << "]: " << msg << "\n";
        out << " --> " << render_location(d, sm) << "\n";
        if (blk.lines.empty()) return out.str();

        const uint32_t last_line_no = blk.first_line_no + static_cast<uint32_t>(blk.lines.size()) - 1;
        const uint32_t w = digits10(last_line_no);

        out << "  |\n";
        for (uint32_t i = 0; i < blk.lines.size(); ++i) {
            const std::string num = std::to_string(blk.first_line_no + i);

            // "  12 | code..."
            out << std::string(2, ' ');
            out << std::string(w - static_cast<uint32_t>(num.size()), ' ') << num;
            out << " | " << blk.lines[i] << "\n";

            if (i == blk.caret_line_offset) {
                out << std::string(2, ' ');
                out << std::string(w, ' ') << " | ";
                out << std::string(blk.caret_cols_before, ' ');
                out << std::string(blk.caret_cols_len, '^') << "\n";
            }
        }

        return out.str();
    }

} // namespace onec::diag
