// frontend/src/tyck/stmt/type_check_stmt.cpp
#include <onec/tyck/TypeCheck.hpp>


namespace onec::tyck {

    ty::TypeId TypeChecker::check_block_(ast::StmtId id) {
        if (id == ast::k_invalid_stmt) return types_.void_();

        const ast::Stmt& blk = ast_.stmt(id);
        ty::TypeId last = types_.void_();
        for (uint32_t i = 0; i < blk.stmt_count; ++i) {
            last = check_stmt_(ast_.stmt_children()[blk.stmt_begin + i]);
        }
        return last;
    }

    ty::TypeId TypeChecker::check_block_scoped_(ast::StmtId id) {
        // 분기/루프 본문은 자식 스코프에서 검사하고 끝나면 버린다
        ScopeGuard guard(env_);
        return check_block_(id);
    }

    ty::TypeId TypeChecker::check_stmt_(ast::StmtId id) {
        const ast::Stmt& s = ast_.stmt(id);

        switch (s.kind) {
            case ast::StmtKind::kReturn:
                if (s.expr == ast::k_invalid_expr) return types_.void_();
                return check_expr_(s.expr);

            case ast::StmtKind::kIf:
            case ast::StmtKind::kEnsure:
                // 조건은 Boolean이 아니어도 허용
                (void)check_expr_(s.expr);
                (void)check_block_scoped_(s.a);
                if (s.b != ast::k_invalid_stmt) (void)check_block_scoped_(s.b);
                return types_.void_();

            case ast::StmtKind::kWhile:
                (void)check_expr_(s.expr);
                (void)check_block_scoped_(s.a);
                return types_.void_();

            case ast::StmtKind::kAssign: {
                const ty::TypeId vt = check_expr_(s.expr);

                // 식별자 대상은 현재 스코프에 (재)정의
                const ast::Expr& target = ast_.expr(s.target);
                if (target.kind == ast::ExprKind::kIdent) {
                    env_.define(target.text, vt);
                }
                return vt;
            }

            case ast::StmtKind::kExprStmt:
                return check_expr_(s.expr);

            case ast::StmtKind::kBlock:
                return check_block_scoped_(id);

            case ast::StmtKind::kBreak:
            case ast::StmtKind::kContinue:
            case ast::StmtKind::kProgram:
            case ast::StmtKind::kFnDecl:
            case ast::StmtKind::kError:
                return types_.void_();
        }
        return types_.void_();
    }

} // namespace onec::tyck
