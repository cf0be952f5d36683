// frontend/src/bc/disasm.cpp
#include <onec/bc/Disasm.hpp>

#include <cstdio>
#include <sstream>
#include <string>
#include <type_traits>


namespace onec::bc {

    namespace {

        std::string quote_(const std::string& s) {
            std::string out;
            out.reserve(s.size() + 2);
            out.push_back('"');
            for (char c : s) {
                switch (c) {
                    case '\n': out += "\\n"; break;
                    case '\t': out += "\\t"; break;
                    case '\r': out += "\\r"; break;
                    case '"': out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    default: out.push_back(c); break;
                }
            }
            out.push_back('"');
            return out;
        }

    } // namespace

    std::string value_to_string(const Value& v) {
        return std::visit([](auto&& x) -> std::string {
            using T = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(x);
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream oss;
                oss << x;
                return oss.str();
            } else if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else {
                return quote_(x);
            }
        }, v);
    }

    std::string operand_to_string(const Operand& o) {
        return std::visit([](auto&& x) -> std::string {
            using T = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, Value>) {
                return value_to_string(x);
            } else if constexpr (std::is_same_v<T, VarName>) {
                return x.name;
            } else if constexpr (std::is_same_v<T, JumpTarget>) {
                return std::to_string(x.index);
            } else if constexpr (std::is_same_v<T, Label>) {
                return "L" + std::to_string(x.id);
            } else if constexpr (std::is_same_v<T, CallTarget>) {
                return x.name + " " + std::to_string(x.argc);
            } else {
                return std::to_string(x.n);
            }
        }, o);
    }

    std::string disassemble_function(const Function& f) {
        std::ostringstream oss;
        oss << "Function " << f.name << " (" << f.param_count() << " params):\n";

        char idx[16];
        for (size_t i = 0; i < f.instructions.size(); ++i) {
            const Instruction& inst = f.instructions[i];
            std::snprintf(idx, sizeof(idx), "%6zu", i);

            oss << idx << ": " << op_name(inst.op);
            const std::string opnd = operand_to_string(inst.operand);
            if (!opnd.empty() || std::holds_alternative<Value>(inst.operand)) {
                oss << " " << opnd;
            }
            oss << "\n";
        }
        return oss.str();
    }

    std::string disassemble_module(const Module& m) {
        std::ostringstream oss;
        oss << "Bytecode Module:\n";
        oss << "Entry point: " << m.entry_point << "\n\n";

        for (const auto& f : m.functions()) {
            oss << disassemble_function(f) << "\n";
        }
        return oss.str();
    }

} // namespace onec::bc
