// frontend/src/tyck/core/type_check_entry.cpp
#include <onec/tyck/TypeCheck.hpp>
#include <onec/tyck/Builtins.hpp>

#include <utility>


namespace onec::tyck {

    namespace {

        ty::TypeId builtin_ty_(const ty::TypePool& types, BuiltinTy b) {
            switch (b) {
                case BuiltinTy::kInteger: return types.integer();
                case BuiltinTy::kString: return types.string();
                case BuiltinTy::kBoolean: return types.boolean();
                case BuiltinTy::kVoid: return types.void_();
            }
            return types.integer();
        }

    } // namespace

    TyckResult TypeChecker::check_program(ast::StmtId program_stmt) {
        // 같은 AST를 두 번 검사해도 같은 결과가 나오도록 매번 초기화
        env_ = TypeEnv{};
        result_ = TyckResult{};
        result_.expr_types.assign(ast_.exprs().size(), ty::kInvalidType);

        if (program_stmt == ast::k_invalid_stmt || program_stmt >= ast_.stmts().size()) {
            return std::move(result_);
        }

        const ast::Stmt& prog = ast_.stmt(program_stmt);

        seed_builtins_();

        // pass 1: 모든 함수 시그니처를 글로벌에 등록 (전방 참조 허용)
        first_pass_collect_signatures_(prog);

        // pass 2: 함수 본문 검사
        for (uint32_t i = 0; i < prog.stmt_count; ++i) {
            const ast::Stmt& s = ast_.stmt(ast_.stmt_children()[prog.stmt_begin + i]);
            if (s.kind == ast::StmtKind::kFnDecl) check_fn_decl_(s);
        }

        result_.ok = result_.errors.empty();
        return std::move(result_);
    }

    void TypeChecker::seed_builtins_() {
        for (const auto& b : k_builtin_table) {
            std::vector<ty::TypeId> params;
            for (uint8_t i = 0; i < b.param_count; ++i) params.push_back(builtin_ty_(types_, b.params[i]));
            env_.define_global(b.name, types_.make_fn(builtin_ty_(types_, b.ret), params));
        }
    }

    void TypeChecker::first_pass_collect_signatures_(const ast::Stmt& program) {
        for (uint32_t i = 0; i < program.stmt_count; ++i) {
            const ast::Stmt& s = ast_.stmt(ast_.stmt_children()[program.stmt_begin + i]);
            if (s.kind != ast::StmtKind::kFnDecl) continue;
            env_.define_global(s.name, fn_signature_(s));
        }
    }

    ty::TypeId TypeChecker::fn_signature_(const ast::Stmt& fn) {
        std::vector<ty::TypeId> params;
        params.reserve(fn.input_count);
        for (uint32_t i = 0; i < fn.input_count; ++i) {
            params.push_back(resolve_type_ann_(ast_.params()[fn.input_begin + i].type));
        }

        // 반환 타입은 첫 번째 output 파라미터만 본다
        ty::TypeId ret = types_.void_();
        if (fn.output_count > 0) {
            ret = resolve_type_ann_(ast_.params()[fn.output_begin].type);
        }
        return types_.make_fn(ret, params);
    }

    ty::TypeId TypeChecker::resolve_type_ann_(ast::TypeAnnId id) {
        // 주석이 없으면 Void
        if (id == ast::k_invalid_type_ann) return types_.void_();

        const ast::TypeAnn& ta = ast_.type_anns()[id];

        if (ta.name == "List") {
            if (ta.arg_count == 0) return types_.make_list(types_.integer());
            return types_.make_list(resolve_type_ann_(ast_.type_ann_args()[ta.arg_begin]));
        }

        ty::TypeId out = ty::kInvalidType;
        if (types_.lookup_name(ta.name, out)) return out;

        // 모르는 타입 이름은 Integer로 취급
        return types_.integer();
    }

    void TypeChecker::check_fn_decl_(const ast::Stmt& fn) {
        ScopeGuard guard(env_);

        for (uint32_t i = 0; i < fn.input_count; ++i) {
            const ast::Param& p = ast_.params()[fn.input_begin + i];
            env_.define(p.name, resolve_type_ann_(p.type));
        }

        if (fn.a != ast::k_invalid_stmt) check_block_(fn.a);
    }

    void TypeChecker::err_(Span sp, diag::Code code, std::string message, std::string_view a0) {
        result_.errors.push_back(TyError{sp, std::move(message)});

        if (diag_bag_) {
            diag::Diagnostic d(diag::Severity::kError, code, sp);
            if (!a0.empty()) d.add_arg(a0);
            diag_bag_->add(std::move(d));
        }
    }

} // namespace onec::tyck
