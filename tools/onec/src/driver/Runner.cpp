// tools/onec/src/driver/Runner.cpp
#include "Runner.hpp"

#include "../dump/Dump.hpp"

#include <onec/ast/Nodes.hpp>
#include <onec/bc/Disasm.hpp>
#include <onec/bc/Serialize.hpp>
#include <onec/diag/Render.hpp>
#include <onec/driver/Compile.hpp>
#include <onec/lex/Lexer.hpp>
#include <onec/os/File.hpp>
#include <onec/parse/Parser.hpp>
#include <onec/text/SourceManager.hpp>

#include <iostream>
#include <string>
#include <vector>


namespace onec::cli {

    namespace {

        /// @brief 진단을 컨텍스트 포함 형태로 stderr에 출력한다.
        void flush_diags(
            const diag::Bag& bag,
            diag::Language lang,
            const SourceManager& sm,
            uint32_t context_lines
        ) {
            for (const auto& d : bag.diags()) {
                std::cerr << diag::render_one_context(d, lang, sm, context_lines) << "\n";
            }
        }

        /// @brief -d: 토큰과 AST를 출력한다. 진단은 compile()에서 다시 나오므로 여기선 버린다.
        void dump_front(const std::string& src, const std::string& name) {
            SourceManager sm;
            const uint32_t file_id = sm.add(name, src);

            diag::Bag scratch;
            Lexer lex(sm.content(file_id), file_id, &scratch);
            const auto tokens = lex.lex_all();

            std::cout << "\n=== Tokens ===\n";
            dump::dump_tokens(std::cout, tokens);
            if (lex.failed()) return;

            ast::AstArena ast;
            Parser parser(tokens, ast, &scratch);
            const auto root = parser.parse_program();

            std::cout << "\n=== AST ===\n";
            if (parser.is_aborted()) {
                std::cout << "  <parse failed>\n";
                return;
            }
            dump::dump_stmt(std::cout, ast, root, 1);
            std::cout << "\n";
        }

        /// @brief 진행 표시: 도달한 단계까지 출력한다.
        void print_stages(const driver::CompileResult& res) {
            static constexpr const char* k_stage_lines[] = {
                "  Stage 1: Lexical analysis...",
                "  Stage 2: Parsing...",
                "  Stage 3: Type checking...",
                "  Stage 4: Code generation...",
            };

            const int reached = res.failed_stage
                ? static_cast<int>(*res.failed_stage) + 1
                : 4;
            for (int i = 0; i < reached; ++i) {
                std::cout << k_stage_lines[i] << "\n";
            }
        }

    } // namespace

    int run(const Options& opt) {
        std::string src;
        std::string err;
        if (!open_file(opt.input_path, src, err)) {
            std::cerr << "error: " << opt.input_path << ": " << err << "\n";
            return 1;
        }

        if (opt.verbose) {
            std::cout << "Compiling " << opt.input_path << "...\n";
        }

        if (opt.dump) {
            dump_front(src, opt.input_path);
        }

        driver::CompileOptions copt{};
        copt.entry_point = opt.entry_point;

        const driver::CompileResult res = driver::compile(src, opt.input_path, copt);

        if (opt.verbose) print_stages(res);
        flush_diags(res.bag, opt.lang, res.sources, opt.context_lines);

        if (!res.ok) {
            std::cerr << "error: compilation failed ("
                      << diag::stage_name(*res.failed_stage) << ")\n";
            return 1;
        }

        if (!res.module.has_entry()) {
            std::cerr << "warning: entry point '" << res.module.entry_point << "' is not defined\n";
        }

        if (opt.verbose) {
            std::cout << "  Compilation successful!\n";
        }

        const std::string out_path = resolved_output_path(opt);
        if (!write_file_bytes(out_path, bc::serialize(res.module), err)) {
            std::cerr << "error: " << out_path << ": " << err << "\n";
            return 1;
        }

        if (opt.verbose) {
            std::cout << "Bytecode saved to " << out_path << "\n";
        }

        if (opt.disasm) {
            std::cout << "\n=== Disassembly ===\n";
            std::cout << bc::disassemble_module(res.module);
        }

        return 0;
    }

} // namespace onec::cli
