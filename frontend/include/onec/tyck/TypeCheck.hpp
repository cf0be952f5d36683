// frontend/include/onec/tyck/TypeCheck.hpp
#pragma once
#include <onec/ast/Nodes.hpp>
#include <onec/ty/TypePool.hpp>
#include <onec/tyck/TypeEnv.hpp>
#include <onec/text/Span.hpp>
#include <onec/diag/Diagnostic.hpp>

#include <string>
#include <vector>


namespace onec::tyck {

    struct TyError {
        Span span{};
        std::string message{};
    };

    struct TyckResult {
        bool ok = true;
        std::vector<ty::TypeId> expr_types; // ast.exprs() index에 대응 (미검사 = kInvalidType)
        std::vector<TyError> errors;
    };

    /// @brief 관대한(bootstrap 수준) 타입 검사기.
    /// @details AST를 변경하지 않는다. 정의되지 않은 식별자만 진단을 남기고,
    ///          나머지 불확실한 경우는 기본 타입(Integer)으로 내려간다.
    ///          중간에 멈추지 않으므로 한 번에 여러 진단이 나올 수 있다.
    class TypeChecker {
    public:
        TypeChecker(const ast::AstArena& ast, ty::TypePool& types)
            : ast_(ast), types_(types) {}

        TypeChecker(const ast::AstArena& ast, ty::TypePool& types, diag::Bag& bag)
            : ast_(ast), types_(types), diag_bag_(&bag) {}

        // program(StmtId) 하나를 타입체크. 호출마다 상태를 새로 만든다.
        TyckResult check_program(ast::StmtId program_stmt);

    private:
        // ---- entry ----
        void seed_builtins_();
        void first_pass_collect_signatures_(const ast::Stmt& program);
        void check_fn_decl_(const ast::Stmt& fn);

        ty::TypeId resolve_type_ann_(ast::TypeAnnId id);
        ty::TypeId fn_signature_(const ast::Stmt& fn);

        // ---- stmt ----
        ty::TypeId check_block_(ast::StmtId id);
        ty::TypeId check_block_scoped_(ast::StmtId id);
        ty::TypeId check_stmt_(ast::StmtId id);

        // ---- expr ----
        ty::TypeId check_expr_(ast::ExprId id);
        ty::TypeId check_expr_impl_(const ast::Expr& e);
        ty::TypeId check_ident_(const ast::Expr& e);
        ty::TypeId check_binary_(const ast::Expr& e);
        ty::TypeId check_unary_(const ast::Expr& e);
        ty::TypeId check_call_(const ast::Expr& e);
        ty::TypeId check_index_(const ast::Expr& e);
        ty::TypeId check_list_lit_(const ast::Expr& e);

        void err_(Span sp, diag::Code code, std::string message, std::string_view a0 = {});

        const ast::AstArena& ast_;
        ty::TypePool& types_;
        diag::Bag* diag_bag_ = nullptr;

        TypeEnv env_{};
        TyckResult result_{};
    };

} // namespace onec::tyck
