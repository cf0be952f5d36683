// frontend/src/lex/lexer.cpp
#include <onec/lex/Lexer.hpp>
#include <onec/syntax/Keywords.hpp>
#include <onec/syntax/Punct.hpp>

#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>


namespace onec {

    namespace {

        bool is_ident_start(char c) {
            const unsigned char u = static_cast<unsigned char>(c);
            return std::isalpha(u) || c == '_';
        }

        bool is_ident_continue(char c) {
            const unsigned char u = static_cast<unsigned char>(c);
            return std::isalnum(u) || c == '_';
        }

        bool is_digit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        // UTF-8 선두 바이트로부터 코드포인트 바이트 수
        size_t utf8_len(unsigned char c0) {
            if (c0 < 0x80) return 1;
            if ((c0 & 0xE0) == 0xC0) return 2;
            if ((c0 & 0xF0) == 0xE0) return 3;
            if ((c0 & 0xF8) == 0xF0) return 4;
            return 1;
        }

    } // namespace

    Lexer::Lexer(std::string_view source, uint32_t file_id, diag::Bag* diags)
        : source_(source), file_id_(file_id), diags_(diags) {}

    char Lexer::peek(size_t k) const {
        const size_t i = pos_ + k;
        if (i >= source_.size()) return '\0';
        return source_[i];
    }

    bool Lexer::eof() const {
        return pos_ >= source_.size();
    }

    char Lexer::bump() {
        if (eof()) return '\0';
        const char c = source_[pos_++];

        if (c == '\n') {
            ++line_;
            col_ = 1;
        } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            // continuation 바이트는 열을 늘리지 않는다
            ++col_;
        }
        return c;
    }

    Span Lexer::mark() const {
        Span sp;
        sp.file_id = file_id_;
        sp.lo = static_cast<uint32_t>(pos_);
        sp.hi = sp.lo;
        sp.line = line_;
        sp.col = col_;
        return sp;
    }

    Token Lexer::finish(syntax::TokenKind kind, Span sp) const {
        sp.hi = static_cast<uint32_t>(pos_);

        Token t;
        t.kind = kind;
        t.span = sp;
        t.lexeme = source_.substr(sp.lo, sp.hi - sp.lo);
        return t;
    }

    void Lexer::report(diag::Code code, Span sp, std::string_view a0) {
        if (failed_) return;
        failed_ = true;
        if (!diags_) return;

        diag::Diagnostic d(diag::Severity::kError, code, sp);
        if (!a0.empty()) d.add_arg(a0);
        diags_->add(std::move(d));
    }

    void Lexer::skip_ws_and_comments() {
        while (!eof() && !failed_) {
            const char c = peek();

            // newline은 토큰이므로 여기서 건너뛰지 않는다
            if (c == ' ' || c == '\t' || c == '\r') {
                bump();
                continue;
            }

            // line comment
            if (c == '/' && peek(1) == '/') {
                while (!eof() && peek() != '\n') bump();
                continue;
            }

            // block comment: 중첩 없음, 첫 "*/"에서 닫힌다
            if (c == '/' && peek(1) == '*') {
                bump();
                bump();
                bool closed = false;
                while (!eof()) {
                    if (peek() == '*' && peek(1) == '/') {
                        bump();
                        bump();
                        closed = true;
                        break;
                    }
                    bump();
                }
                if (!closed) {
                    report(diag::Code::kUnterminatedBlockComment, mark());
                }
                continue;
            }

            break;
        }
    }

    Token Lexer::lex_number() {
        const Span sp = mark();
        while (is_digit(peek())) bump();

        // "1." 뒤에 숫자가 없으면 float가 아니다 (member access 여지)
        if (peek() == '.' && is_digit(peek(1))) {
            bump();
            while (is_digit(peek())) bump();

            Token t = finish(syntax::TokenKind::kFloatLit, sp);
            t.value = std::strtod(std::string(t.lexeme).c_str(), nullptr);
            return t;
        }

        Token t = finish(syntax::TokenKind::kIntLit, sp);

        int64_t v = 0;
        constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
        for (char c : t.lexeme) {
            const int64_t d = c - '0';
            if (v > (kMax - d) / 10) {
                report(diag::Code::kIntLiteralOutOfRange, t.span, t.lexeme);
                return t;
            }
            v = v * 10 + d;
        }
        t.value = v;
        return t;
    }

    Token Lexer::lex_ident_or_kw() {
        const Span sp = mark();
        while (is_ident_continue(peek())) bump();

        Token t = finish(syntax::TokenKind::kIdent, sp);
        t.kind = syntax::keyword_or_ident(t.lexeme);

        if (t.kind == syntax::TokenKind::kKwTrue) t.value = true;
        else if (t.kind == syntax::TokenKind::kKwFalse) t.value = false;
        return t;
    }

    Token Lexer::lex_string() {
        const Span open = mark();
        bump(); // opening quote

        std::string decoded;
        while (!eof()) {
            const char c = peek();
            if (c == '"') {
                bump();
                Token t = finish(syntax::TokenKind::kStringLit, open);
                t.value = std::move(decoded);
                return t;
            }

            if (c == '\\') {
                bump();
                if (eof()) break;

                const Span esc = mark();
                const char e = bump();
                switch (e) {
                    case 'n':  decoded.push_back('\n'); break;
                    case 't':  decoded.push_back('\t'); break;
                    case 'r':  decoded.push_back('\r'); break;
                    case '\\': decoded.push_back('\\'); break;
                    case '"':  decoded.push_back('"');  break;
                    default: {
                        const char buf[2] = {e, '\0'};
                        report(diag::Code::kUnknownEscape, esc, buf);
                        return finish(syntax::TokenKind::kError, open);
                    }
                }
                continue;
            }

            decoded.push_back(bump());
        }

        // 닫히지 않은 문자열은 EOF가 아니라 여는 따옴표 위치에서 보고한다
        report(diag::Code::kUnterminatedString, open);
        return finish(syntax::TokenKind::kError, open);
    }

    Token Lexer::lex_punct_or_unknown() {
        const Span sp = mark();

        // maximal munch using k_punct_table
        for (const auto& e : syntax::k_punct_table) {
            const auto s = e.text;
            bool ok = true;
            for (size_t i = 0; i < s.size(); ++i) {
                if (peek(i) != s[i]) { ok = false; break; }
            }
            if (!ok) continue;

            for (size_t i = 0; i < s.size(); ++i) bump();
            return finish(e.kind, sp);
        }

        // unknown char (코드포인트 단위로 보고)
        const size_t n = utf8_len(static_cast<unsigned char>(peek()));
        for (size_t i = 0; i < n && !eof(); ++i) bump();

        Token t = finish(syntax::TokenKind::kError, sp);
        report(diag::Code::kUnexpectedChar, t.span, t.lexeme);
        return t;
    }

    void Lexer::emit_eof(std::vector<Token>& out) {
        Token t = finish(syntax::TokenKind::kEof, mark());
        out.push_back(t);
    }

    std::vector<Token> Lexer::lex_all() {
        std::vector<Token> out;
        out.reserve(source_.size() / 4 + 1);

        while (!eof() && !failed_) {
            skip_ws_and_comments();
            if (eof() || failed_) break;

            const char c = peek();

            if (c == '\n') {
                const Span sp = mark();
                bump();
                out.push_back(finish(syntax::TokenKind::kNewline, sp));
                continue;
            }

            if (is_digit(c)) {
                out.push_back(lex_number());
                continue;
            }

            if (c == '"') {
                out.push_back(lex_string());
                continue;
            }

            if (is_ident_start(c)) {
                out.push_back(lex_ident_or_kw());
                continue;
            }

            out.push_back(lex_punct_or_unknown());
        }

        emit_eof(out);
        return out;
    }

    bool tokenize(std::string_view source, uint32_t file_id, diag::Bag& diags, std::vector<Token>& out) {
        Lexer lx(source, file_id, &diags);
        out = lx.lex_all();
        return !lx.failed();
    }

} // namespace onec
