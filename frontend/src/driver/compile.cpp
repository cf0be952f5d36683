// frontend/src/driver/compile.cpp
#include <onec/driver/Compile.hpp>

#include <onec/ast/Nodes.hpp>
#include <onec/bc/Builder.hpp>
#include <onec/lex/Lexer.hpp>
#include <onec/parse/Parser.hpp>
#include <onec/ty/TypePool.hpp>


namespace onec::driver {

    CompileResult compile(std::string_view source, std::string name, const CompileOptions& opt) {
        CompileResult res{};
        res.file_id = res.sources.add(std::move(name), std::string(source));

        // 1) lex
        std::vector<Token> tokens;
        if (!tokenize(res.sources.content(res.file_id), res.file_id, res.bag, tokens)) {
            res.failed_stage = diag::Stage::kLex;
            return res;
        }

        // 2) parse
        ast::AstArena ast;
        Parser parser(tokens, ast, &res.bag);
        const ast::StmtId root = parser.parse_program();
        if (parser.is_aborted() || root == ast::k_invalid_stmt) {
            res.failed_stage = diag::Stage::kParse;
            return res;
        }

        // 3) type check
        if (opt.check_types) {
            ty::TypePool types;
            tyck::TypeChecker checker(ast, types, res.bag);
            tyck::TyckResult tr = checker.check_program(root);
            res.type_errors = std::move(tr.errors);
            if (!tr.ok) {
                res.failed_stage = diag::Stage::kTypeCheck;
                return res;
            }
        }

        // 4) codegen
        bc::Builder builder(ast, &res.bag);
        builder.set_entry_point(opt.entry_point);
        bc::BuildResult br = builder.build(root);
        if (!br.ok) {
            res.failed_stage = diag::Stage::kCodegen;
            return res;
        }

        res.module = std::move(br.mod);
        res.ok = true;
        return res;
    }

} // namespace onec::driver
