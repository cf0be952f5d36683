#include <onec/lex/Lexer.hpp>
#include <onec/diag/Render.hpp>
#include <onec/text/SourceManager.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using K = onec::syntax::TokenKind;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    struct Lexed {
        std::vector<onec::Token> tokens;
        onec::diag::Bag bag;
        bool ok = false;
    };

    static Lexed lex_(std::string_view src) {
        Lexed out{};
        out.ok = onec::tokenize(src, /*file_id=*/0, out.bag, out.tokens);
        return out;
    }

    static bool kinds_are_(const std::vector<onec::Token>& toks, const std::vector<K>& want) {
        if (toks.size() != want.size()) return false;
        for (size_t i = 0; i < want.size(); ++i) {
            if (toks[i].kind != want[i]) return false;
        }
        return true;
    }

    static bool test_simple_binary_columns_() {
        const std::string src = "a+b";
        const auto r = lex_(src);

        bool ok = true;
        ok &= require_(r.ok, "a+b must lex");
        ok &= require_(kinds_are_(r.tokens, {K::kIdent, K::kPlus, K::kIdent, K::kEof}),
                       "a+b must be IDENT PLUS IDENT EOF");
        if (!ok) return false;

        ok &= require_(r.tokens[0].lexeme == "a" && r.tokens[2].lexeme == "b", "identifier text must be kept");
        ok &= require_(r.tokens[0].span.col == 1, "a must be at column 1");
        ok &= require_(r.tokens[1].span.col == 2, "+ must be at column 2");
        ok &= require_(r.tokens[2].span.col == 3, "b must be at column 3");
        for (size_t i = 0; i < 3; ++i) {
            ok &= require_(r.tokens[i].span.line == 1, "all tokens must be on line 1");
        }
        return ok;
    }

    static bool test_unterminated_string_reports_opening_quote_() {
        const std::string src = "x = \"abc";
        const auto r = lex_(src);

        bool ok = true;
        ok &= require_(!r.ok, "unterminated string must fail");
        ok &= require_(r.bag.has_code(onec::diag::Code::kUnterminatedString), "must report UnterminatedString");
        if (!ok) return false;

        const auto& d = r.bag.diags().front();
        ok &= require_(d.stage() == onec::diag::Stage::kLex, "must be a lex-stage diagnostic");
        ok &= require_(d.span().line == 1, "error line must be 1");
        ok &= require_(d.span().col == 5, "error column must point at the opening quote");
        ok &= require_(d.span().lo == 4, "error byte offset must point at the opening quote");
        return ok;
    }

    static bool test_newlines_are_tokens_() {
        const auto r = lex_("a\n\nb");

        bool ok = true;
        ok &= require_(r.ok, "must lex");
        ok &= require_(kinds_are_(r.tokens, {K::kIdent, K::kNewline, K::kNewline, K::kIdent, K::kEof}),
                       "each newline must be its own token");
        if (!ok) return false;

        ok &= require_(r.tokens[3].span.line == 3, "b must be on line 3");
        ok &= require_(r.tokens[3].span.col == 1, "b must be at column 1");
        return ok;
    }

    static bool test_keywords_and_literal_values_() {
        const auto r = lex_("function inputs outputs requirements implementation true false null foo");

        bool ok = true;
        ok &= require_(r.ok, "must lex");
        ok &= require_(kinds_are_(r.tokens, {
            K::kKwFunction, K::kKwInputs, K::kKwOutputs, K::kKwRequirements, K::kKwImplementation,
            K::kKwTrue, K::kKwFalse, K::kKwNull, K::kIdent, K::kEof,
        }), "keywords must classify, others stay identifiers");
        if (!ok) return false;

        const auto* t = std::get_if<bool>(&r.tokens[5].value);
        const auto* f = std::get_if<bool>(&r.tokens[6].value);
        ok &= require_(t && *t, "true must carry decoded value");
        ok &= require_(f && !*f, "false must carry decoded value");
        ok &= require_(std::holds_alternative<std::monostate>(r.tokens[7].value), "null carries no value");
        return ok;
    }

    static bool test_two_char_operators_are_greedy_() {
        const auto r = lex_("== != <= >= << >> += -= *= /= -> => ** < > = * -");

        return require_(kinds_are_(r.tokens, {
            K::kEqEq, K::kBangEq, K::kLtEq, K::kGtEq, K::kShiftLeft, K::kShiftRight,
            K::kPlusAssign, K::kMinusAssign, K::kStarAssign, K::kSlashAssign,
            K::kArrow, K::kFatArrow, K::kStarStar,
            K::kLt, K::kGt, K::kAssign, K::kStar, K::kMinus, K::kEof,
        }), "two-char operators must win over their one-char prefix");
    }

    static bool test_number_and_string_decoding_() {
        const auto r = lex_("42 3.25 \"a\\n\\t\\\"b\\\\\"");

        bool ok = true;
        ok &= require_(r.ok, "must lex");
        ok &= require_(kinds_are_(r.tokens, {K::kIntLit, K::kFloatLit, K::kStringLit, K::kEof}), "literal kinds");
        if (!ok) return false;

        const auto* i = std::get_if<int64_t>(&r.tokens[0].value);
        const auto* f = std::get_if<double>(&r.tokens[1].value);
        const auto* s = std::get_if<std::string>(&r.tokens[2].value);
        ok &= require_(i && *i == 42, "integer must decode");
        ok &= require_(f && *f == 3.25, "float must decode");
        ok &= require_(s && *s == "a\n\t\"b\\", "escapes must decode");
        return ok;
    }

    static bool test_dot_after_int_is_not_float_() {
        const auto r = lex_("1.foo");
        return require_(kinds_are_(r.tokens, {K::kIntLit, K::kDot, K::kIdent, K::kEof}),
                        "'1.' without a digit must stay INT DOT");
    }

    static bool test_comments_are_skipped_() {
        const auto r = lex_("a // line\n/* block\n comment */ b");

        bool ok = true;
        ok &= require_(r.ok, "must lex");
        ok &= require_(kinds_are_(r.tokens, {K::kIdent, K::kNewline, K::kIdent, K::kEof}),
                       "comments must not produce tokens");
        if (!ok) return false;
        ok &= require_(r.tokens[2].span.line == 3, "line counting must continue inside block comments");
        return ok;
    }

    static bool test_unterminated_block_comment_() {
        const auto r = lex_("a /* never closed");
        bool ok = true;
        ok &= require_(!r.ok, "must fail");
        ok &= require_(r.bag.has_code(onec::diag::Code::kUnterminatedBlockComment), "must report block comment");
        return ok;
    }

    static bool test_unknown_escape_location_() {
        const auto r = lex_("\"\\q\"");
        bool ok = true;
        ok &= require_(!r.ok, "must fail");
        ok &= require_(r.bag.has_code(onec::diag::Code::kUnknownEscape), "must report UnknownEscape");
        if (!ok) return false;
        ok &= require_(r.bag.diags().front().span().col == 3, "must point at the escaped character");
        return ok;
    }

    static bool test_unexpected_char_stops_lexing_() {
        const auto r = lex_("a @ b $");
        bool ok = true;
        ok &= require_(!r.ok, "must fail");
        ok &= require_(r.bag.diags().size() == 1, "lexing must stop at the first error");
        ok &= require_(r.bag.has_code(onec::diag::Code::kUnexpectedChar), "must report UnexpectedChar");
        ok &= require_(!r.tokens.empty() && r.tokens.back().kind == K::kEof, "token list must still end in EOF");
        return ok;
    }

    static bool test_int_literal_out_of_range_() {
        const auto r = lex_("99999999999999999999");
        bool ok = true;
        ok &= require_(!r.ok, "must fail");
        ok &= require_(r.bag.has_code(onec::diag::Code::kIntLiteralOutOfRange), "must report range error");

        const auto max = lex_("9223372036854775807");
        ok &= require_(max.ok, "int64 max must lex");
        return ok;
    }

    static bool test_columns_count_code_points_() {
        const auto r = lex_("\"\xC3\xA9\" x");
        bool ok = true;
        ok &= require_(r.ok, "must lex");
        ok &= require_(r.tokens.size() == 3, "string, ident, eof");
        if (!ok) return false;
        ok &= require_(r.tokens[1].span.col == 5, "multi-byte character must count as one column");
        return ok;
    }

    static bool test_brief_render_location_triple_() {
        onec::SourceManager sm;
        const std::string src = "x = 1\ny = \"oops";
        const uint32_t fid = sm.add("demo.one", src);

        onec::diag::Bag bag;
        std::vector<onec::Token> toks;
        const bool ok_lex = onec::tokenize(sm.content(fid), fid, bag, toks);

        bool ok = true;
        ok &= require_(!ok_lex, "must fail");
        if (!ok) return false;

        const std::string brief = onec::diag::render_brief(bag.diags().front(), onec::diag::Language::kEn, sm);
        ok &= require_(brief == "LexError: Unterminated string at demo.one:2:5", "brief render must be 'Stage: msg at name:line:col'");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"simple_binary_columns", test_simple_binary_columns_},
        {"unterminated_string_reports_opening_quote", test_unterminated_string_reports_opening_quote_},
        {"newlines_are_tokens", test_newlines_are_tokens_},
        {"keywords_and_literal_values", test_keywords_and_literal_values_},
        {"two_char_operators_are_greedy", test_two_char_operators_are_greedy_},
        {"number_and_string_decoding", test_number_and_string_decoding_},
        {"dot_after_int_is_not_float", test_dot_after_int_is_not_float_},
        {"comments_are_skipped", test_comments_are_skipped_},
        {"unterminated_block_comment", test_unterminated_block_comment_},
        {"unknown_escape_location", test_unknown_escape_location_},
        {"unexpected_char_stops_lexing", test_unexpected_char_stops_lexing_},
        {"int_literal_out_of_range", test_int_literal_out_of_range_},
        {"columns_count_code_points", test_columns_count_code_points_},
        {"brief_render_location_triple", test_brief_render_location_triple_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
