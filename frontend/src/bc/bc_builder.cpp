// frontend/src/bc/bc_builder.cpp
#include <onec/bc/Builder.hpp>

#include <string>
#include <vector>


namespace onec::bc {

    namespace {

        using K = syntax::TokenKind;

        /// @brief 함수 하나를 생성하는 동안만 사는 상태.
        /// label 테이블과 loop 스택은 함수와 함께 만들어지고 버려진다.
        struct FuncBuild {
            const ast::AstArena* ast = nullptr;
            diag::Bag* diags = nullptr;
            Function* fn = nullptr;

            bool failed = false;

            // label id -> 아직 해소되지 않은 점프 위치들
            std::vector<std::vector<uint32_t>> label_sites;
            std::vector<bool> label_resolved;

            struct LoopContext {
                Label break_label{};
                uint32_t continue_index = 0;  // 조건 재평가 시작 위치
            };

            std::vector<LoopContext> loop_stack;

            uint32_t here() const {
                return static_cast<uint32_t>(fn->instructions.size());
            }

            uint32_t emit(Op op, Operand operand, Span sp) {
                Instruction inst{};
                inst.op = op;
                inst.operand = std::move(operand);
                inst.loc = sp;
                fn->instructions.push_back(std::move(inst));
                return here() - 1;
            }

            uint32_t emit(Op op, Span sp) {
                return emit(op, Operand{}, sp);
            }

            void emit_const(Value v, Span sp) {
                bool seen = false;
                for (const auto& c : fn->constants) {
                    if (c == v) { seen = true; break; }
                }
                if (!seen) fn->constants.push_back(v);

                emit(Op::kLoadConst, Operand{std::move(v)}, sp);
            }

            Label new_label() {
                Label l{};
                l.id = static_cast<uint32_t>(label_sites.size());
                label_sites.emplace_back();
                label_resolved.push_back(false);
                return l;
            }

            void emit_jump(Op op, Label l, Span sp) {
                const uint32_t site = emit(op, Operand{l}, sp);
                label_sites[l.id].push_back(site);
            }

            /// @brief label을 현재 위치로 해소하고 기록된 점프들을 고친다.
            void patch_label(Label l) {
                const uint32_t target = here();
                for (uint32_t site : label_sites[l.id]) {
                    fn->instructions[site].operand = JumpTarget{target};
                }
                label_sites[l.id].clear();
                label_resolved[l.id] = true;
            }

            bool all_labels_resolved() const {
                for (bool r : label_resolved) {
                    if (!r) return false;
                }
                return true;
            }

            void fail(diag::Code code, Span sp, std::string_view a0 = {}) {
                if (failed) return;
                failed = true;
                if (!diags) return;

                diag::Diagnostic d(diag::Severity::kError, code, sp);
                if (!a0.empty()) d.add_arg(a0);
                diags->add(std::move(d));
            }

            // --------------------
            // stmt
            // --------------------

            void gen_block(ast::StmtId id) {
                if (id == ast::k_invalid_stmt) return;

                const ast::Stmt& blk = ast->stmt(id);
                for (uint32_t i = 0; i < blk.stmt_count && !failed; ++i) {
                    gen_stmt(ast->stmt_children()[blk.stmt_begin + i]);
                }
            }

            void gen_stmt(ast::StmtId id) {
                const ast::Stmt& s = ast->stmt(id);

                switch (s.kind) {
                    case ast::StmtKind::kReturn:
                        if (s.expr != ast::k_invalid_expr) gen_expr(s.expr);
                        else emit_const(Value{}, s.span);
                        emit(Op::kReturn, s.span);
                        return;

                    case ast::StmtKind::kIf:
                    case ast::StmtKind::kEnsure:
                        gen_cond(s);
                        return;

                    case ast::StmtKind::kWhile:
                        gen_while(s);
                        return;

                    case ast::StmtKind::kAssign:
                        gen_assign(s);
                        return;

                    case ast::StmtKind::kBreak:
                        if (loop_stack.empty()) {
                            fail(diag::Code::kBreakOutsideLoop, s.span);
                            return;
                        }
                        emit_jump(Op::kJump, loop_stack.back().break_label, s.span);
                        return;

                    case ast::StmtKind::kContinue:
                        if (loop_stack.empty()) {
                            fail(diag::Code::kContinueOutsideLoop, s.span);
                            return;
                        }
                        // continue 위치는 이미 알고 있으므로 label이 필요 없다
                        emit(Op::kJump, Operand{JumpTarget{loop_stack.back().continue_index}}, s.span);
                        return;

                    case ast::StmtKind::kExprStmt:
                        gen_expr(s.expr);
                        emit(Op::kPop, s.span);
                        return;

                    case ast::StmtKind::kBlock:
                        gen_block(id);
                        return;

                    case ast::StmtKind::kProgram:
                    case ast::StmtKind::kFnDecl:
                    case ast::StmtKind::kError:
                        return;
                }
            }

            // if/ensure: cond, JIF else, then, JUMP end, else:, [else-block], end:
            void gen_cond(const ast::Stmt& s) {
                gen_expr(s.expr);

                const Label else_l = new_label();
                const Label end_l = new_label();

                emit_jump(Op::kJumpIfFalse, else_l, s.span);
                gen_block(s.a);
                emit_jump(Op::kJump, end_l, s.span);

                patch_label(else_l);
                if (s.b != ast::k_invalid_stmt) gen_block(s.b);

                patch_label(end_l);
            }

            void gen_while(const ast::Stmt& s) {
                const Label end_l = new_label();
                const uint32_t start = here();

                loop_stack.push_back(LoopContext{end_l, start});

                gen_expr(s.expr);
                emit_jump(Op::kJumpIfFalse, end_l, s.span);
                gen_block(s.a);

                // 조건 첫 명령으로 되돌아간다
                emit(Op::kJump, Operand{JumpTarget{start}}, s.span);

                patch_label(end_l);
                loop_stack.pop_back();
            }

            void gen_assign(const ast::Stmt& s) {
                const ast::Expr& target = ast->expr(s.target);
                if (target.kind != ast::ExprKind::kIdent) {
                    fail(diag::Code::kAssignTargetNotIdentifier, target.span, syntax::token_kind_name(s.op));
                    return;
                }

                gen_expr(s.expr);
                if (failed) return;

                const std::string name(target.text);

                // 복합 할당: RHS, 현재 값, 연산, 저장
                if (s.op != K::kAssign) {
                    emit(Op::kLoadVar, Operand{VarName{name}}, s.span);
                    switch (s.op) {
                        case K::kPlusAssign: emit(Op::kAdd, s.span); break;
                        case K::kMinusAssign: emit(Op::kSub, s.span); break;
                        case K::kStarAssign: emit(Op::kMul, s.span); break;
                        case K::kSlashAssign: emit(Op::kDiv, s.span); break;
                        default:
                            fail(diag::Code::kUnsupportedOperator, s.span, syntax::token_kind_name(s.op));
                            return;
                    }
                }

                emit(Op::kStoreVar, Operand{VarName{name}}, s.span);
            }

            // --------------------
            // expr
            // --------------------

            void gen_expr(ast::ExprId id) {
                if (failed) return;
                const ast::Expr& e = ast->expr(id);

                switch (e.kind) {
                    case ast::ExprKind::kIntLit:
                        emit_const(Value{e.int_value}, e.span);
                        return;
                    case ast::ExprKind::kFloatLit:
                        emit_const(Value{e.float_value}, e.span);
                        return;
                    case ast::ExprKind::kStringLit:
                        emit_const(Value{std::string(e.string_value)}, e.span);
                        return;
                    case ast::ExprKind::kBoolLit:
                        emit_const(Value{e.bool_value}, e.span);
                        return;
                    case ast::ExprKind::kNullLit:
                        emit_const(Value{}, e.span);
                        return;

                    case ast::ExprKind::kIdent:
                        emit(Op::kLoadVar, Operand{VarName{std::string(e.text)}}, e.span);
                        return;

                    case ast::ExprKind::kBinary:
                        gen_binary(e);
                        return;

                    case ast::ExprKind::kUnary:
                        gen_expr(e.a);
                        if (e.op == K::kMinus) emit(Op::kNeg, e.span);
                        else if (e.op == K::kKwNot) emit(Op::kNot, e.span);
                        else fail(diag::Code::kUnsupportedOperator, e.span, syntax::token_kind_name(e.op));
                        return;

                    case ast::ExprKind::kCall:
                        gen_call(e);
                        return;

                    case ast::ExprKind::kMember:
                        // 멤버 접근 opcode는 없다: 객체는 평가해서 버리고 null을 남긴다
                        gen_expr(e.a);
                        emit(Op::kPop, e.span);
                        emit_const(Value{}, e.span);
                        return;

                    case ast::ExprKind::kIndex:
                        gen_expr(e.a);
                        gen_expr(e.b);
                        emit(Op::kIndex, e.span);
                        return;

                    case ast::ExprKind::kListLit:
                        for (uint32_t i = 0; i < e.arg_count; ++i) {
                            gen_expr(ast->expr_args()[e.arg_begin + i]);
                        }
                        emit(Op::kBuildList, Operand{Count{e.arg_count}}, e.span);
                        return;

                    case ast::ExprKind::kError:
                        fail(diag::Code::kUnsupportedOperator, e.span, "<error>");
                        return;
                }
            }

            void gen_binary(const ast::Expr& e) {
                gen_expr(e.a);
                gen_expr(e.b);
                if (failed) return;

                Op op = Op::kHalt;
                switch (e.op) {
                    case K::kPlus: op = Op::kAdd; break;
                    case K::kMinus: op = Op::kSub; break;
                    case K::kStar: op = Op::kMul; break;
                    case K::kSlash: op = Op::kDiv; break;
                    case K::kPercent: op = Op::kMod; break;
                    case K::kStarStar: op = Op::kPow; break;
                    case K::kEqEq: op = Op::kEq; break;
                    case K::kBangEq: op = Op::kNe; break;
                    case K::kLt: op = Op::kLt; break;
                    case K::kGt: op = Op::kGt; break;
                    case K::kLtEq: op = Op::kLe; break;
                    case K::kGtEq: op = Op::kGe; break;
                    case K::kKwAnd: op = Op::kAnd; break;
                    case K::kKwOr: op = Op::kOr; break;
                    default:
                        fail(diag::Code::kUnsupportedOperator, e.span, syntax::token_kind_name(e.op));
                        return;
                }
                emit(op, e.span);
            }

            void gen_call(const ast::Expr& e) {
                // 인자는 왼쪽부터 평가해서 push
                for (uint32_t i = 0; i < e.arg_count; ++i) {
                    gen_expr(ast->expr_args()[e.arg_begin + i]);
                }
                if (failed) return;

                const ast::Expr& callee = ast->expr(e.a);
                if (callee.kind != ast::ExprKind::kIdent) {
                    fail(diag::Code::kCallTargetNotIdentifier, callee.span);
                    return;
                }

                if (callee.text == "print") {
                    emit(Op::kPrint, e.span);
                    return;
                }
                if (callee.text == "println") {
                    emit(Op::kPrintln, e.span);
                    return;
                }

                emit(Op::kCall, Operand{CallTarget{std::string(callee.text), e.arg_count}}, e.span);
            }

            /// @brief 끝에 RETURN이 없거나, 어떤 점프가 함수 끝을 가리키면 void return을 덧붙인다.
            bool needs_implicit_return() const {
                const auto& insts = fn->instructions;
                if (insts.empty() || insts.back().op != Op::kReturn) return true;

                const uint32_t end = here();
                for (const auto& inst : insts) {
                    if (const auto* t = std::get_if<JumpTarget>(&inst.operand)) {
                        if (t->index == end) return true;
                    }
                }
                return false;
            }
        };

    } // namespace

    BuildResult Builder::build(ast::StmtId program_stmt) {
        BuildResult out{};
        out.mod.entry_point = entry_point_;

        if (program_stmt == ast::k_invalid_stmt) return out;
        const ast::Stmt& prog = ast_.stmt(program_stmt);

        for (uint32_t i = 0; i < prog.stmt_count; ++i) {
            const ast::Stmt& decl = ast_.stmt(ast_.stmt_children()[prog.stmt_begin + i]);
            if (decl.kind != ast::StmtKind::kFnDecl) continue;

            Function f{};
            f.name = std::string(decl.name);
            for (uint32_t k = 0; k < decl.input_count; ++k) {
                f.param_names.emplace_back(ast_.params()[decl.input_begin + k].name);
            }

            FuncBuild fb{};
            fb.ast = &ast_;
            fb.diags = diags_;
            fb.fn = &f;

            fb.gen_block(decl.a);
            if (fb.failed) {
                out.ok = false;
                return out;
            }

            if (fb.needs_implicit_return()) {
                Span end_sp = (decl.a != ast::k_invalid_stmt) ? ast_.stmt(decl.a).span : decl.span;
                end_sp.lo = end_sp.hi;
                fb.emit_const(Value{}, end_sp);
                fb.emit(Op::kReturn, end_sp);
            }

            if (!fb.all_labels_resolved()) {
                // 생성기 자체의 불변식 위반
                fb.fail(diag::Code::kUnsupportedOperator, decl.span, "<unresolved label>");
                out.ok = false;
                return out;
            }

            const bool replaced = out.mod.put_function(std::move(f));
            if (replaced && diags_) {
                diag::Diagnostic d(diag::Severity::kWarning, diag::Code::kDuplicateFunction, decl.span);
                d.add_arg(decl.name);
                diags_->add(std::move(d));
            }
        }

        return out;
    }

} // namespace onec::bc
