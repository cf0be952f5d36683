// tools/onec/src/dump/Dump.hpp
#pragma once

#include <onec/ast/Nodes.hpp>
#include <onec/lex/Token.hpp>

#include <ostream>
#include <vector>


namespace onec::dump {

    /// @brief 토큰 목록을 출력한다.
    void dump_tokens(std::ostream& os, const std::vector<Token>& tokens);

    /// @brief AST expression 트리를 출력한다.
    void dump_expr(std::ostream& os, const ast::AstArena& ast, ast::ExprId id, int indent);

    /// @brief AST statement 트리를 출력한다.
    void dump_stmt(std::ostream& os, const ast::AstArena& ast, ast::StmtId id, int indent);

} // namespace onec::dump
