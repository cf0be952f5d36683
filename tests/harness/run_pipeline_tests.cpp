#include <onec/driver/Compile.hpp>
#include <onec/bc/Disasm.hpp>
#include <onec/bc/Serialize.hpp>
#include <onec/bc/Verify.hpp>
#include <onec/diag/Render.hpp>
#include <onec/os/File.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using onec::bc::Op;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    constexpr std::string_view k_add_src =
        "function add:\n"
        "  inputs:\n"
        "    a: Integer\n"
        "    b: Integer\n"
        "  outputs:\n"
        "    result: Integer\n"
        "  implementation:\n"
        "    return a + b\n";

    // 모든 operand 형태(const/var/jump/call/count)를 쓰는 프로그램
    constexpr std::string_view k_full_src =
        "function fib:\n"
        "  inputs:\n"
        "    n: Integer\n"
        "  outputs:\n"
        "    r: Integer\n"
        "  requirements:\n"
        "    - n >= 0\n"
        "  implementation:\n"
        "    if n < 2: { return n }\n"
        "    return fib(n - 1) + fib(n - 2)\n"
        "\n"
        "function main:\n"
        "  implementation: {\n"
        "    i = 0\n"
        "    xs = [1.5, \"two\", true, null]\n"
        "    while i < 10: {\n"
        "      i += 1\n"
        "      if i == 5: { continue }\n"
        "      if i > 8: { break }\n"
        "      println(int_to_str(fib(i)))\n"
        "    }\n"
        "    ensure i > 0: { print(\"done\") } otherwise: { exit(1) }\n"
        "  }\n";

    static bool test_end_to_end_add_() {
        const auto res = onec::driver::compile(k_add_src, "add.one");

        bool ok = true;
        ok &= require_(res.ok, "add must compile");
        ok &= require_(!res.failed_stage.has_value(), "no failed stage");
        ok &= require_(res.bag.diags().empty(), "zero diagnostics");
        ok &= require_(res.type_errors.empty(), "zero type errors");
        if (!ok) return false;

        const auto* f = res.module.find("add");
        ok &= require_(f && f->instructions.size() == 4, "add has exactly 4 instructions");
        if (!ok) return false;
        ok &= require_(f->instructions[2].op == Op::kAdd && f->instructions[3].op == Op::kReturn, "ADD then RETURN");
        ok &= require_(!res.module.has_entry(), "no main defined");
        return ok;
    }

    static bool test_lex_failure_stops_pipeline_() {
        const auto res = onec::driver::compile(
            "function main:\n  implementation:\n    s = \"abc\n", "bad.one");

        bool ok = true;
        ok &= require_(!res.ok, "must fail");
        ok &= require_(res.failed_stage == onec::diag::Stage::kLex, "fails in lex");
        ok &= require_(res.bag.diags().size() == 1, "one diagnostic");
        ok &= require_(res.module.size() == 0, "no partial module");
        if (!ok) return false;

        const std::string brief = onec::diag::render_brief(
            res.bag.diags().front(), onec::diag::Language::kEn, res.sources);
        ok &= require_(brief == "LexError: Unterminated string at bad.one:3:9", "location triple of the opening quote");
        return ok;
    }

    static bool test_parse_failure_stage_() {
        const auto res = onec::driver::compile("function main\n", "p.one");

        bool ok = true;
        ok &= require_(!res.ok, "must fail");
        ok &= require_(res.failed_stage == onec::diag::Stage::kParse, "fails in parse");
        ok &= require_(res.bag.has_error_in(onec::diag::Stage::kParse), "parse diagnostic");
        return ok;
    }

    static bool test_type_failure_reports_every_error_() {
        const auto res = onec::driver::compile(
            "function main:\n  implementation:\n    x = a\n    return b\n", "t.one");

        bool ok = true;
        ok &= require_(!res.ok, "must fail");
        ok &= require_(res.failed_stage == onec::diag::Stage::kTypeCheck, "fails in type check");
        ok &= require_(res.type_errors.size() == 2, "both undefined variables are listed");
        ok &= require_(res.bag.error_count() == 2, "both are in the bag");
        ok &= require_(res.module.size() == 0, "generator never runs");
        if (!ok) return false;

        const std::string brief = onec::diag::render_brief(
            res.bag.diags()[1], onec::diag::Language::kEn, res.sources);
        ok &= require_(brief == "TypeCheckError: Undefined variable: b at t.one:4:12", "type error brief");
        return ok;
    }

    static bool test_check_types_can_be_disabled_() {
        onec::driver::CompileOptions opt{};
        opt.check_types = false;
        const auto res = onec::driver::compile(
            "function main:\n  implementation:\n    return undefined_name\n", "n.one", opt);

        bool ok = true;
        ok &= require_(res.ok, "without the checker the program generates");
        ok &= require_(res.module.has_entry(), "main exists");
        return ok;
    }

    static bool test_codegen_failure_stage_() {
        const auto res = onec::driver::compile(
            "function main:\n  implementation:\n    continue\n", "c.one");

        bool ok = true;
        ok &= require_(!res.ok, "must fail");
        ok &= require_(res.failed_stage == onec::diag::Stage::kCodegen, "fails in codegen");
        ok &= require_(res.bag.has_code(onec::diag::Code::kContinueOutsideLoop), "ContinueOutsideLoop");
        if (!ok) return false;

        const std::string brief = onec::diag::render_brief(
            res.bag.diags().front(), onec::diag::Language::kEn, res.sources);
        ok &= require_(brief == "CodeGenError: Continue outside loop at c.one:3:5", "codegen brief");

        const std::string full = onec::diag::render_one_context(
            res.bag.diags().front(), onec::diag::Language::kEn, res.sources, /*context_lines=*/0);
        ok &= require_(full ==
                       "error[ContinueOutsideLoop]: Continue outside loop\n"
                       " --> c.one:3:5\n"
                       "  |\n"
                       "  3 |     continue\n"
                       "    |     ^^^^^^^^\n",
                       "caret snippet under the statement");
        return ok;
    }

    static bool test_every_function_ends_in_return_() {
        const auto res = onec::driver::compile(k_full_src, "full.one");

        bool ok = true;
        ok &= require_(res.ok, "full program must compile");
        if (!ok) {
            for (const auto& d : res.bag.diags()) {
                std::cerr << "    " << onec::diag::render_brief(d, onec::diag::Language::kEn, res.sources) << "\n";
            }
            return false;
        }

        ok &= require_(res.module.size() == 2, "two functions");
        ok &= require_(res.module.has_entry(), "main is the entry point");
        for (const auto& f : res.module.functions()) {
            ok &= require_(!f.instructions.empty() && f.instructions.back().op == Op::kReturn,
                           "each function ends in RETURN");
        }
        ok &= require_(onec::bc::verify(res.module).empty(), "module verifies");
        return ok;
    }

    static bool test_compile_is_repeatable_() {
        const auto a = onec::driver::compile(k_full_src, "full.one");
        const auto b = onec::driver::compile(k_full_src, "full.one");

        bool ok = true;
        ok &= require_(a.ok && b.ok, "both compile");
        ok &= require_(onec::bc::disassemble_module(a.module) == onec::bc::disassemble_module(b.module),
                       "independent compilations give identical output");
        return ok;
    }

    static bool test_module_disassembly_header_() {
        const auto res = onec::driver::compile(k_add_src, "add.one");
        const std::string text = onec::bc::disassemble_module(res.module);

        const std::string want_prefix = "Bytecode Module:\nEntry point: main\n\nFunction add (2 params):\n";
        return require_(text.compare(0, want_prefix.size(), want_prefix) == 0, "module header");
    }

    static bool test_serialize_round_trip_() {
        const auto res = onec::driver::compile(k_full_src, "full.one");
        if (!require_(res.ok, "must compile")) return false;

        const auto bytes = onec::bc::serialize(res.module);

        onec::bc::Module back;
        std::string err;
        bool ok = true;
        ok &= require_(onec::bc::deserialize(bytes, back, err), "must deserialize");
        if (!ok) {
            std::cerr << "    " << err << "\n";
            return false;
        }

        ok &= require_(back.entry_point == res.module.entry_point, "entry point survives");
        ok &= require_(back.size() == res.module.size(), "function count survives");
        for (const auto& f : res.module.functions()) {
            const auto* g = back.find(f.name);
            ok &= require_(g != nullptr, "function survives");
            if (!g) continue;

            ok &= require_(g->param_names == f.param_names, "params survive");
            ok &= require_(g->constants == f.constants, "constants survive");
            ok &= require_(g->instructions.size() == f.instructions.size(), "instruction count survives");
            for (size_t i = 0; ok && i < f.instructions.size(); ++i) {
                const auto& x = f.instructions[i];
                const auto& y = g->instructions[i];
                ok &= require_(x.op == y.op && x.operand == y.operand, "instruction survives");
                ok &= require_(x.loc.has_value() == y.loc.has_value(), "location presence survives");
                if (x.loc && y.loc) {
                    ok &= require_(x.loc->line == y.loc->line && x.loc->col == y.loc->col, "location survives");
                }
            }
        }
        ok &= require_(onec::bc::serialize(back) == bytes, "re-serialization is byte identical");
        return ok;
    }

    static bool test_deserialize_rejects_bad_input_() {
        const auto res = onec::driver::compile(k_add_src, "add.one");
        const auto bytes = onec::bc::serialize(res.module);

        bool ok = true;
        onec::bc::Module m;
        std::string err;

        auto bad_magic = bytes;
        bad_magic[0] = 'X';
        ok &= require_(!onec::bc::deserialize(bad_magic, m, err) && !err.empty(), "bad magic rejected");

        auto bad_version = bytes;
        bad_version[4] = 0x7F;
        ok &= require_(!onec::bc::deserialize(bad_version, m, err), "unknown version rejected");

        std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<long>(bytes.size() / 2));
        ok &= require_(!onec::bc::deserialize(truncated, m, err), "truncated data rejected");

        auto trailing = bytes;
        trailing.push_back(0);
        ok &= require_(!onec::bc::deserialize(trailing, m, err), "trailing bytes rejected");
        return ok;
    }

    static bool test_file_helpers_() {
        namespace fs = std::filesystem;
        const fs::path dir = fs::temp_directory_path() / "onec_pipeline_tests";
        std::error_code ec;
        fs::create_directories(dir, ec);

        bool ok = true;

        const fs::path src = dir / "crlf.one";
        {
            std::ofstream out(src, std::ios::binary);
            out << "function main:\r\n  implementation:\r\n    return 1\r\n";
        }
        std::string content;
        std::string err;
        ok &= require_(onec::open_file(src.string(), content, err), "open_file must succeed");
        ok &= require_(content.find('\r') == std::string::npos, "CRLF is normalized");

        const auto res = onec::driver::compile(content, src.string());
        ok &= require_(res.ok, "normalized source compiles");

        const fs::path bc = dir / "crlf.1bc";
        const auto bytes = onec::bc::serialize(res.module);
        ok &= require_(onec::write_file_bytes(bc.string(), bytes, err), "write must succeed");

        std::vector<uint8_t> read_back;
        ok &= require_(onec::read_file_bytes(bc.string(), read_back, err), "read must succeed");
        ok &= require_(read_back == bytes, "bytes round-trip through the file");

        ok &= require_(!onec::open_file((dir / "missing.one").string(), content, err), "missing file fails");
        ok &= require_(!err.empty(), "missing file reports an error");

        fs::remove_all(dir, ec);
        return ok;
    }

    static bool test_replace_extension_() {
        bool ok = true;
        ok &= require_(onec::replace_extension("prog.one", ".1bc") == "prog.1bc", "simple");
        ok &= require_(onec::replace_extension("dir.v2/prog", ".1bc") == "dir.v2/prog.1bc", "dot in directory");
        ok &= require_(onec::replace_extension("a/b.c.one", ".1bc") == "a/b.c.1bc", "last dot only");
        ok &= require_(onec::replace_extension(".hidden", ".1bc") == ".hidden.1bc", "leading dot");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"end_to_end_add", test_end_to_end_add_},
        {"lex_failure_stops_pipeline", test_lex_failure_stops_pipeline_},
        {"parse_failure_stage", test_parse_failure_stage_},
        {"type_failure_reports_every_error", test_type_failure_reports_every_error_},
        {"check_types_can_be_disabled", test_check_types_can_be_disabled_},
        {"codegen_failure_stage", test_codegen_failure_stage_},
        {"every_function_ends_in_return", test_every_function_ends_in_return_},
        {"compile_is_repeatable", test_compile_is_repeatable_},
        {"module_disassembly_header", test_module_disassembly_header_},
        {"serialize_round_trip", test_serialize_round_trip_},
        {"deserialize_rejects_bad_input", test_deserialize_rejects_bad_input_},
        {"file_helpers", test_file_helpers_},
        {"replace_extension", test_replace_extension_},
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
