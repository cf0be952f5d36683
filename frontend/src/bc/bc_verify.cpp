// frontend/src/bc/bc_verify.cpp
#include <onec/bc/Verify.hpp>

#include <sstream>
#include <string>
#include <type_traits>
#include <vector>


namespace onec::bc {

    namespace {

        void push_error_(std::vector<VerifyError>& out, const Function& f, uint32_t idx, const std::string& msg) {
            out.push_back(VerifyError{f.name, idx, msg});
        }

        /// @brief operand의 실제 형태를 OperandKind로 바꾼다. Label은 별도로 잡는다.
        bool operand_matches_(OperandKind want, const Operand& o) {
            return std::visit([&](auto&& x) -> bool {
                using T = std::decay_t<decltype(x)>;

                if constexpr (std::is_same_v<T, std::monostate>) return want == OperandKind::kNone;
                else if constexpr (std::is_same_v<T, Value>) return want == OperandKind::kConst;
                else if constexpr (std::is_same_v<T, VarName>) return want == OperandKind::kVar;
                else if constexpr (std::is_same_v<T, JumpTarget>) return want == OperandKind::kTarget;
                else if constexpr (std::is_same_v<T, CallTarget>) return want == OperandKind::kCall;
                else if constexpr (std::is_same_v<T, Count>) return want == OperandKind::kCount;
                else return false;  // Label
            }, o);
        }

        void verify_function_(const Function& f, std::vector<VerifyError>& errs) {
            const uint32_t n = static_cast<uint32_t>(f.instructions.size());

            if (n == 0) {
                push_error_(errs, f, 0, "function has no instructions");
                return;
            }

            for (uint32_t i = 0; i < n; ++i) {
                const Instruction& inst = f.instructions[i];
                const OpInfo& info = op_info(inst.op);

                if (std::holds_alternative<Label>(inst.operand)) {
                    std::ostringstream oss;
                    oss << op_name(inst.op) << " still carries unresolved label L"
                        << std::get<Label>(inst.operand).id;
                    push_error_(errs, f, i, oss.str());
                    continue;
                }

                if (!operand_matches_(info.operand, inst.operand)) {
                    std::ostringstream oss;
                    oss << op_name(inst.op) << " has mismatched operand '"
                        << operand_to_string(inst.operand) << "'";
                    push_error_(errs, f, i, oss.str());
                    continue;
                }

                if (const auto* t = std::get_if<JumpTarget>(&inst.operand)) {
                    // 함수 끝(n)은 유효한 대상이다
                    if (t->index > n) {
                        std::ostringstream oss;
                        oss << op_name(inst.op) << " targets " << t->index
                            << " outside [0, " << n << "]";
                        push_error_(errs, f, i, oss.str());
                    }
                }

                if (const auto* c = std::get_if<CallTarget>(&inst.operand)) {
                    if (c->name.empty()) {
                        push_error_(errs, f, i, "CALL with empty function name");
                    }
                }
            }

            if (f.instructions.back().op != Op::kReturn) {
                push_error_(errs, f, n - 1, "function does not end with RETURN");
            }
        }

    } // namespace

    std::vector<VerifyError> verify(const Module& m) {
        std::vector<VerifyError> errs;
        for (const auto& f : m.functions()) {
            verify_function_(f, errs);
        }
        return errs;
    }

} // namespace onec::bc
