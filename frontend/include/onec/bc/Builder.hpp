// frontend/include/onec/bc/Builder.hpp
#pragma once
#include <onec/bc/Bytecode.hpp>
#include <onec/ast/Nodes.hpp>
#include <onec/diag/Diagnostic.hpp>

#include <string>
#include <utility>


namespace onec::bc {

    struct BuildResult {
        Module mod;
        bool ok = true;
    };

    /// @brief (검사를 통과한) AST를 스택 바이트코드 모듈로 내린다.
    /// @details 함수 단위로 한 번의 선형 패스. 첫 생성 오류에서 중단한다.
    ///          break/continue가 루프 밖에 있거나, 지원하지 않는 연산자,
    ///          단순 이름이 아닌 호출/할당 대상만 오류가 된다.
    class Builder {
    public:
        Builder(const ast::AstArena& ast, diag::Bag* diags = nullptr)
            : ast_(ast), diags_(diags) {}

        void set_entry_point(std::string name) { entry_point_ = std::move(name); }

        BuildResult build(ast::StmtId program_stmt);

    private:
        const ast::AstArena& ast_;
        diag::Bag* diags_ = nullptr;
        std::string entry_point_ = "main";
    };

} // namespace onec::bc
