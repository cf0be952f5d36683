#include <onec/lex/Lexer.hpp>
#include <onec/parse/Parser.hpp>
#include <onec/bc/Builder.hpp>
#include <onec/bc/Disasm.hpp>
#include <onec/bc/Verify.hpp>

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

    struct Generated {
        std::vector<onec::Token> tokens;
        onec::ast::AstArena ast;
        onec::diag::Bag bag;
        onec::bc::BuildResult out;
        bool parsed = false;
    };

    static void gen_(std::string_view src, Generated& g, std::string entry = "main") {
        if (!onec::tokenize(src, /*file_id=*/0, g.bag, g.tokens)) return;

        onec::Parser parser(g.tokens, g.ast, &g.bag);
        const auto root = parser.parse_program();
        if (parser.is_aborted()) return;
        g.parsed = true;

        onec::bc::Builder builder(g.ast, &g.bag);
        builder.set_entry_point(std::move(entry));
        g.out = builder.build(root);
    }

    static bool ops_are_(const onec::bc::Function& f, const std::vector<Op>& want) {
        if (f.instructions.size() != want.size()) return false;
        for (size_t i = 0; i < want.size(); ++i) {
            if (f.instructions[i].op != want[i]) return false;
        }
        return true;
    }

    static std::string var_of_(const onec::bc::Instruction& inst) {
        if (const auto* v = std::get_if<onec::bc::VarName>(&inst.operand)) return v->name;
        return "<none>";
    }

    static uint32_t target_of_(const onec::bc::Instruction& inst) {
        if (const auto* t = std::get_if<onec::bc::JumpTarget>(&inst.operand)) return t->index;
        return 0xFFFF'FFFFu;
    }

    static bool has_label_operand_(const onec::bc::Module& m) {
        for (const auto& f : m.functions()) {
            for (const auto& inst : f.instructions) {
                if (std::holds_alternative<onec::bc::Label>(inst.operand)) return true;
            }
        }
        return false;
    }

    static bool test_add_exact_sequence_() {
        Generated g;
        gen_(
            "function add:\n"
            "  inputs:\n"
            "    a: Integer\n"
            "    b: Integer\n"
            "  outputs:\n"
            "    result: Integer\n"
            "  implementation:\n"
            "    return a + b\n",
            g);

        bool ok = true;
        ok &= require_(g.parsed && g.out.ok, "add must generate");
        if (!ok) return false;

        const auto* f = g.out.mod.find("add");
        ok &= require_(f != nullptr, "function add exists");
        if (!ok) return false;

        ok &= require_(ops_are_(*f, {Op::kLoadVar, Op::kLoadVar, Op::kAdd, Op::kReturn}),
                       "exactly LOAD_VAR, LOAD_VAR, ADD, RETURN");
        if (!ok) return false;

        ok &= require_(var_of_(f->instructions[0]) == "a", "first load is a");
        ok &= require_(var_of_(f->instructions[1]) == "b", "second load is b");
        ok &= require_(f->param_names == std::vector<std::string>{"a", "b"}, "parameter names");
        ok &= require_(f->constants.empty(), "no constants used");

        const std::string text = onec::bc::disassemble_function(*f);
        ok &= require_(text ==
            "Function add (2 params):\n"
            "     0: LOAD_VAR a\n"
            "     1: LOAD_VAR b\n"
            "     2: ADD\n"
            "     3: RETURN\n",
            "disassembly text");
        return ok;
    }

    static bool test_while_loop_layout_() {
        Generated g;
        gen_("function main:\n  implementation:\n    x = 0\n    while x < 3: x += 1\n", g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("main");
        ok &= require_(ops_are_(f, {
            Op::kLoadConst, Op::kStoreVar,                          // x = 0
            Op::kLoadVar, Op::kLoadConst, Op::kLt, Op::kJumpIfFalse, // cond
            Op::kLoadConst, Op::kLoadVar, Op::kAdd, Op::kStoreVar,   // x += 1
            Op::kJump,                                               // back edge
            Op::kLoadConst, Op::kReturn,                             // implicit return
        }), "while lowering sequence");
        if (!ok) return false;

        // 역방향 점프 찾기
        size_t back = 0;
        for (size_t i = 0; i < f.instructions.size(); ++i) {
            const auto& inst = f.instructions[i];
            if (inst.op == Op::kJump && target_of_(inst) < i) back = i;
        }
        ok &= require_(back == 10, "backward jump present");
        ok &= require_(f.instructions[back - 1].op == Op::kStoreVar &&
                       var_of_(f.instructions[back - 1]) == "x",
                       "instruction before the back edge implements +=");
        ok &= require_(target_of_(f.instructions[back]) == 2, "back edge targets the first condition instruction");
        ok &= require_(target_of_(f.instructions[5]) == 11, "exit jump targets the instruction after the loop");
        return ok;
    }

    static bool test_break_continue_targets_() {
        Generated g;
        gen_(
            "function main:\n  implementation: {\n"
            "    while true: {\n"
            "      if done: { break }\n"
            "      continue\n"
            "    }\n"
            "  }\n",
            g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("main");
        // 0 LOAD_CONST true, 1 JIF end, 2 LOAD_VAR done, 3 JIF else, 4 JUMP(break), 5 JUMP endif,
        // 6 JUMP(continue)->0, 7 JUMP->0, 8 LOAD_CONST null, 9 RETURN
        ok &= require_(f.instructions.size() == 10, "instruction count");
        if (!ok) return false;

        ok &= require_(f.instructions[4].op == Op::kJump && target_of_(f.instructions[4]) == 8, "break jumps past the loop");
        ok &= require_(f.instructions[6].op == Op::kJump && target_of_(f.instructions[6]) == 0, "continue jumps to the condition");
        ok &= require_(target_of_(f.instructions[1]) == 8, "loop exit");
        ok &= require_(!has_label_operand_(g.out.mod), "no label operands remain");
        ok &= require_(onec::bc::verify(g.out.mod).empty(), "module verifies");
        return ok;
    }

    static bool test_break_outside_loop_() {
        Generated g;
        gen_("function main:\n  implementation:\n    break\n", g);

        bool ok = true;
        ok &= require_(g.parsed, "parser accepts break anywhere");
        ok &= require_(!g.out.ok, "generation must fail");
        ok &= require_(g.bag.has_code(onec::diag::Code::kBreakOutsideLoop), "BreakOutsideLoop");
        ok &= require_(g.bag.has_error_in(onec::diag::Stage::kCodegen), "codegen-stage error");
        return ok;
    }

    static bool test_continue_outside_loop_() {
        Generated g;
        gen_("function main:\n  implementation:\n    if x:\n      continue\n", g);

        bool ok = true;
        ok &= require_(!g.out.ok, "generation must fail");
        ok &= require_(g.bag.has_code(onec::diag::Code::kContinueOutsideLoop), "ContinueOutsideLoop");
        return ok;
    }

    static bool test_implicit_return_() {
        Generated g;
        gen_("function main:\n  implementation:\n    println(\"hi\")\n", g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("main");
        ok &= require_(ops_are_(f, {Op::kLoadConst, Op::kPrintln, Op::kPop, Op::kLoadConst, Op::kReturn}),
                       "print intrinsic, pop, implicit null return");
        if (!ok) return false;

        const auto* v = std::get_if<onec::bc::Value>(&f.instructions[3].operand);
        ok &= require_(v && std::holds_alternative<std::monostate>(*v), "implicit return value is null");
        return ok;
    }

    static bool test_branch_returns_still_get_end_return_() {
        Generated g;
        gen_("function pick:\n  inputs:\n    c\n  implementation:\n    if c: { return 1 } else: { return 2 }\n", g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("pick");
        const uint32_t n = static_cast<uint32_t>(f.instructions.size());
        ok &= require_(f.instructions.back().op == Op::kReturn, "ends in RETURN");
        for (const auto& inst : f.instructions) {
            if (onec::bc::is_jump(inst.op)) {
                ok &= require_(target_of_(inst) < n, "every jump lands on an existing instruction");
            }
        }
        ok &= require_(onec::bc::verify(g.out.mod).empty(), "module verifies");
        return ok;
    }

    static bool test_if_and_ensure_lower_alike_() {
        Generated a;
        Generated b;
        gen_("function main:\n  implementation:\n    if c: { f(1) } else: { f(2) }\n", a);
        gen_("function main:\n  implementation:\n    ensure c: { f(1) } otherwise: { f(2) }\n", b);

        bool ok = true;
        ok &= require_(a.out.ok && b.out.ok, "both generate");
        if (!ok) return false;

        const auto& fa = *a.out.mod.find("main");
        const auto& fb = *b.out.mod.find("main");
        ok &= require_(fa.instructions.size() == fb.instructions.size(), "same length");
        for (size_t i = 0; ok && i < fa.instructions.size(); ++i) {
            ok &= require_(fa.instructions[i].op == fb.instructions[i].op, "same opcodes");
            ok &= require_(fa.instructions[i].operand == fb.instructions[i].operand, "same operands");
        }
        return ok;
    }

    static bool test_calls_and_intrinsics_() {
        Generated g;
        gen_("function main:\n  implementation:\n    r = add(1, 2)\n    print(r)\n", g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("main");
        ok &= require_(f.instructions[2].op == Op::kCall, "generic call");
        const auto* c = std::get_if<onec::bc::CallTarget>(&f.instructions[2].operand);
        ok &= require_(c && c->name == "add" && c->argc == 2, "call carries (name, argc)");
        ok &= require_(f.instructions[5].op == Op::kPrint, "print is an intrinsic opcode");
        return ok;
    }

    static bool test_non_identifier_call_target_() {
        Generated g;
        gen_("function main:\n  implementation:\n    obj.method(1)\n", g);

        bool ok = true;
        ok &= require_(g.parsed, "parser accepts method calls");
        ok &= require_(!g.out.ok, "generation must fail");
        ok &= require_(g.bag.has_code(onec::diag::Code::kCallTargetNotIdentifier), "CallTargetNotIdentifier");
        return ok;
    }

    static bool test_member_access_lowering_() {
        Generated g;
        gen_("function main:\n  implementation:\n    y = obj.field\n", g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("main");
        ok &= require_(ops_are_(f, {Op::kLoadVar, Op::kPop, Op::kLoadConst, Op::kStoreVar, Op::kLoadConst, Op::kReturn}),
                       "object evaluated and dropped, null pushed");
        return ok;
    }

    static bool test_non_identifier_assign_target_() {
        Generated a;
        gen_("function main:\n  implementation:\n    obj.field = 3\n", a);
        Generated b;
        gen_("function main:\n  implementation:\n    xs[0] += 3\n", b);

        bool ok = true;
        ok &= require_(!a.out.ok && a.bag.has_code(onec::diag::Code::kAssignTargetNotIdentifier), "member target rejected");
        ok &= require_(!b.out.ok && b.bag.has_code(onec::diag::Code::kAssignTargetNotIdentifier), "index target rejected");
        return ok;
    }

    static bool test_compound_assignment_order_() {
        Generated g;
        gen_("function main:\n  implementation:\n    x -= 2\n", g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("main");
        ok &= require_(ops_are_(f, {Op::kLoadConst, Op::kLoadVar, Op::kSub, Op::kStoreVar, Op::kLoadConst, Op::kReturn}),
                       "rhs, current value, op, store");
        return ok;
    }

    static bool test_tilde_is_unsupported_() {
        Generated g;
        gen_("function main:\n  implementation:\n    x = ~y\n", g);

        bool ok = true;
        ok &= require_(g.parsed, "parser accepts ~");
        ok &= require_(!g.out.ok && g.bag.has_code(onec::diag::Code::kUnsupportedOperator), "UnsupportedOperator");
        return ok;
    }

    static bool test_lists_and_constants_() {
        Generated g;
        gen_("function main:\n  implementation:\n    xs = [1, 1, \"a\"]\n    return xs[1]\n", g);

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("main");
        ok &= require_(ops_are_(f, {
            Op::kLoadConst, Op::kLoadConst, Op::kLoadConst, Op::kBuildList, Op::kStoreVar,
            Op::kLoadVar, Op::kLoadConst, Op::kIndex, Op::kReturn,
        }), "list build and index");
        if (!ok) return false;

        const auto* cnt = std::get_if<onec::bc::Count>(&f.instructions[3].operand);
        ok &= require_(cnt && cnt->n == 3, "BUILD_LIST carries the element count");
        ok &= require_(f.constants.size() == 2, "constants are deduplicated");
        ok &= require_(f.constants[0] == onec::bc::Value{int64_t{1}}, "first constant is 1");
        ok &= require_(f.constants[1] == onec::bc::Value{std::string("a")}, "second constant is \"a\"");
        return ok;
    }

    static bool test_duplicate_function_last_wins_() {
        Generated g;
        gen_(
            "function f:\n  implementation:\n    return 1\n"
            "function f:\n  implementation:\n    return 2\n",
            g);

        bool ok = true;
        ok &= require_(g.out.ok, "duplicates are not an error");
        ok &= require_(g.out.mod.size() == 1, "one entry per name");
        ok &= require_(g.bag.has_code(onec::diag::Code::kDuplicateFunction), "duplicate is reported");
        ok &= require_(!g.bag.has_error(), "as a warning only");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("f");
        ok &= require_(f.constants.size() == 1 && f.constants[0] == onec::bc::Value{int64_t{2}},
                       "the later definition wins");
        return ok;
    }

    static bool test_entry_point_and_locations_() {
        Generated g;
        gen_("function start:\n  implementation:\n    x = 1\n    return x\n", g, "start");

        bool ok = true;
        ok &= require_(g.out.ok, "must generate");
        ok &= require_(g.out.mod.entry_point == "start", "entry point is configurable");
        ok &= require_(g.out.mod.has_entry(), "entry function exists");
        if (!ok) return false;

        const auto& f = *g.out.mod.find("start");
        for (const auto& inst : f.instructions) {
            ok &= require_(inst.loc.has_value(), "every instruction carries a location");
        }
        ok &= require_(f.instructions[0].loc->line == 3, "x = 1 is on line 3");
        ok &= require_(f.instructions.back().loc->line == 4, "return is on line 4");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"add_exact_sequence", test_add_exact_sequence_},
        {"while_loop_layout", test_while_loop_layout_},
        {"break_continue_targets", test_break_continue_targets_},
        {"break_outside_loop", test_break_outside_loop_},
        {"continue_outside_loop", test_continue_outside_loop_},
        {"implicit_return", test_implicit_return_},
        {"branch_returns_still_get_end_return", test_branch_returns_still_get_end_return_},
        {"if_and_ensure_lower_alike", test_if_and_ensure_lower_alike_},
        {"calls_and_intrinsics", test_calls_and_intrinsics_},
        {"non_identifier_call_target", test_non_identifier_call_target_},
        {"member_access_lowering", test_member_access_lowering_},
        {"non_identifier_assign_target", test_non_identifier_assign_target_},
        {"compound_assignment_order", test_compound_assignment_order_},
        {"tilde_is_unsupported", test_tilde_is_unsupported_},
        {"lists_and_constants", test_lists_and_constants_},
        {"duplicate_function_last_wins", test_duplicate_function_last_wins_},
        {"entry_point_and_locations", test_entry_point_and_locations_},
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
