// frontend/src/tyck/expr/type_check_expr_core.cpp
#include <onec/tyck/TypeCheck.hpp>

#include <string>


namespace onec::tyck {

    using K = syntax::TokenKind;

    ty::TypeId TypeChecker::check_expr_(ast::ExprId id) {
        if (id == ast::k_invalid_expr) return types_.integer();

        const ty::TypeId t = check_expr_impl_(ast_.expr(id));
        if (id < result_.expr_types.size()) result_.expr_types[id] = t;
        return t;
    }

    ty::TypeId TypeChecker::check_expr_impl_(const ast::Expr& e) {
        switch (e.kind) {
            case ast::ExprKind::kIntLit: return types_.integer();
            case ast::ExprKind::kFloatLit: return types_.float_();
            case ast::ExprKind::kStringLit: return types_.string();
            case ast::ExprKind::kBoolLit: return types_.boolean();
            case ast::ExprKind::kNullLit: return types_.void_();

            case ast::ExprKind::kIdent: return check_ident_(e);
            case ast::ExprKind::kBinary: return check_binary_(e);
            case ast::ExprKind::kUnary: return check_unary_(e);
            case ast::ExprKind::kCall: return check_call_(e);

            case ast::ExprKind::kMember:
                // 멤버 타입은 추적하지 않는다
                (void)check_expr_(e.a);
                return types_.integer();

            case ast::ExprKind::kIndex: return check_index_(e);
            case ast::ExprKind::kListLit: return check_list_lit_(e);

            case ast::ExprKind::kError:
                return types_.integer();
        }
        return types_.integer();
    }

    ty::TypeId TypeChecker::check_ident_(const ast::Expr& e) {
        if (auto t = env_.lookup(e.text)) return *t;

        err_(e.span, diag::Code::kUndefinedVariable, "Undefined variable: " + std::string(e.text), e.text);
        return types_.integer();
    }

    ty::TypeId TypeChecker::check_binary_(const ast::Expr& e) {
        const ty::TypeId lt = check_expr_(e.a);
        const ty::TypeId rt = check_expr_(e.b);

        switch (e.op) {
            case K::kPlus:
            case K::kMinus:
            case K::kStar:
            case K::kSlash:
            case K::kPercent:
            case K::kStarStar: {
                const bool l_num = (lt == types_.integer() || lt == types_.float_());
                const bool r_num = (rt == types_.integer() || rt == types_.float_());
                if (l_num && r_num && (lt == types_.float_() || rt == types_.float_())) {
                    return types_.float_();
                }
                return types_.integer();
            }

            case K::kEqEq:
            case K::kBangEq:
            case K::kLt:
            case K::kGt:
            case K::kLtEq:
            case K::kGtEq:
            case K::kKwAnd:
            case K::kKwOr:
                return types_.boolean();

            default:
                return types_.integer();
        }
    }

    ty::TypeId TypeChecker::check_unary_(const ast::Expr& e) {
        const ty::TypeId ot = check_expr_(e.a);

        if (e.op == K::kMinus) return ot;
        if (e.op == K::kKwNot) return types_.boolean();
        return types_.integer();
    }

    ty::TypeId TypeChecker::check_call_(const ast::Expr& e) {
        const ty::TypeId ft = check_expr_(e.a);

        for (uint32_t i = 0; i < e.arg_count; ++i) {
            (void)check_expr_(ast_.expr_args()[e.arg_begin + i]);
        }

        if (types_.is_fn(ft)) return types_.get(ft).ret;
        return types_.void_();
    }

    ty::TypeId TypeChecker::check_index_(const ast::Expr& e) {
        const ty::TypeId ot = check_expr_(e.a);
        (void)check_expr_(e.b);

        if (types_.is_list(ot)) return types_.get(ot).elem;
        return types_.integer();
    }

    ty::TypeId TypeChecker::check_list_lit_(const ast::Expr& e) {
        if (e.arg_count == 0) return types_.make_list(types_.integer());

        // 첫 원소 타입을 쓰고 나머지는 검사만 한다 (통일하지 않음)
        const ty::TypeId first = check_expr_(ast_.expr_args()[e.arg_begin]);
        for (uint32_t i = 1; i < e.arg_count; ++i) {
            (void)check_expr_(ast_.expr_args()[e.arg_begin + i]);
        }
        return types_.make_list(first);
    }

} // namespace onec::tyck
