// frontend/include/onec/bc/Bytecode.hpp
#pragma once
#include <onec/text/Span.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>


namespace onec::bc {

    // 실행 엔진과의 계약: opcode 집합, operand 형태, 스택 효과, 절대 인덱스 점프.
    enum class Op : uint8_t {
        // stack
        kLoadConst,
        kLoadVar,
        kStoreVar,
        kPop,

        // arithmetic
        kAdd,
        kSub,
        kMul,
        kDiv,
        kMod,
        kPow,
        kNeg,

        // comparison
        kEq,
        kNe,
        kLt,
        kGt,
        kLe,
        kGe,

        // logical
        kAnd,
        kOr,
        kNot,

        // control
        kJump,
        kJumpIfFalse,
        kJumpIfTrue,

        // calls
        kCall,
        kReturn,
        kHalt,

        // aggregate
        kBuildList,
        kIndex,

        // intrinsics
        kPrint,
        kPrintln,
    };

    inline constexpr uint32_t k_op_count = static_cast<uint32_t>(Op::kPrintln) + 1;

    enum class OperandKind : uint8_t {
        kNone,
        kConst,     // Value
        kVar,       // VarName
        kTarget,    // JumpTarget (생성 중에는 Label)
        kCall,      // CallTarget
        kCount,     // Count
    };

    /// @brief opcode별 고정 정보. pops < 0 이면 operand에 따라 가변(call argc, list n).
    struct OpInfo {
        Op op;
        std::string_view name;
        OperandKind operand;
        int8_t pops;
        int8_t pushes;
    };

    inline constexpr std::array<OpInfo, k_op_count> k_op_table = {{
        {Op::kLoadConst,   "LOAD_CONST",    OperandKind::kConst,  0, 1},
        {Op::kLoadVar,     "LOAD_VAR",      OperandKind::kVar,    0, 1},
        {Op::kStoreVar,    "STORE_VAR",     OperandKind::kVar,    1, 0},
        {Op::kPop,         "POP",           OperandKind::kNone,   1, 0},

        {Op::kAdd,         "ADD",           OperandKind::kNone,   2, 1},
        {Op::kSub,         "SUB",           OperandKind::kNone,   2, 1},
        {Op::kMul,         "MUL",           OperandKind::kNone,   2, 1},
        {Op::kDiv,         "DIV",           OperandKind::kNone,   2, 1},
        {Op::kMod,         "MOD",           OperandKind::kNone,   2, 1},
        {Op::kPow,         "POW",           OperandKind::kNone,   2, 1},
        {Op::kNeg,         "NEG",           OperandKind::kNone,   1, 1},

        {Op::kEq,          "EQ",            OperandKind::kNone,   2, 1},
        {Op::kNe,          "NE",            OperandKind::kNone,   2, 1},
        {Op::kLt,          "LT",            OperandKind::kNone,   2, 1},
        {Op::kGt,          "GT",            OperandKind::kNone,   2, 1},
        {Op::kLe,          "LE",            OperandKind::kNone,   2, 1},
        {Op::kGe,          "GE",            OperandKind::kNone,   2, 1},

        {Op::kAnd,         "AND",           OperandKind::kNone,   2, 1},
        {Op::kOr,          "OR",            OperandKind::kNone,   2, 1},
        {Op::kNot,         "NOT",           OperandKind::kNone,   1, 1},

        {Op::kJump,        "JUMP",          OperandKind::kTarget, 0, 0},
        {Op::kJumpIfFalse, "JUMP_IF_FALSE", OperandKind::kTarget, 1, 0},
        {Op::kJumpIfTrue,  "JUMP_IF_TRUE",  OperandKind::kTarget, 1, 0},

        {Op::kCall,        "CALL",          OperandKind::kCall,  -1, 1},
        {Op::kReturn,      "RETURN",        OperandKind::kNone,   1, 0},
        {Op::kHalt,        "HALT",          OperandKind::kNone,   0, 0},

        {Op::kBuildList,   "BUILD_LIST",    OperandKind::kCount, -1, 1},
        {Op::kIndex,       "INDEX",         OperandKind::kNone,   2, 1},

        // print/println은 인자 1개를 소비하고 void를 push한다 (호출과 같은 규약)
        {Op::kPrint,       "PRINT",         OperandKind::kNone,   1, 1},
        {Op::kPrintln,     "PRINTLN",       OperandKind::kNone,   1, 1},
    }};

    constexpr bool op_table_in_order_() {
        for (uint32_t i = 0; i < k_op_count; ++i) {
            if (static_cast<uint32_t>(k_op_table[i].op) != i) return false;
        }
        return true;
    }
    static_assert(op_table_in_order_(), "k_op_table must follow Op declaration order");

    constexpr const OpInfo& op_info(Op op) {
        return k_op_table[static_cast<uint32_t>(op)];
    }

    constexpr std::string_view op_name(Op op) {
        return op_info(op).name;
    }

    constexpr bool is_jump(Op op) {
        return op == Op::kJump || op == Op::kJumpIfFalse || op == Op::kJumpIfTrue;
    }

    /// @brief 상수 값. monostate는 null(=void).
    using Value = std::variant<std::monostate, int64_t, double, bool, std::string>;

    struct VarName {
        std::string name;
        bool operator==(const VarName& o) const { return name == o.name; }
    };

    struct JumpTarget {
        uint32_t index = 0;   // 절대 명령 인덱스
        bool operator==(const JumpTarget& o) const { return index == o.index; }
    };

    /// @brief 아직 해소되지 않은 점프 대상. 함수 생성이 끝나기 전에 모두 JumpTarget으로 바뀐다.
    struct Label {
        uint32_t id = 0;
        bool operator==(const Label& o) const { return id == o.id; }
    };

    struct CallTarget {
        std::string name;
        uint32_t argc = 0;
        bool operator==(const CallTarget& o) const { return name == o.name && argc == o.argc; }
    };

    struct Count {
        uint32_t n = 0;
        bool operator==(const Count& o) const { return n == o.n; }
    };

    using Operand = std::variant<std::monostate, Value, VarName, JumpTarget, Label, CallTarget, Count>;

    struct Instruction {
        Op op = Op::kHalt;
        Operand operand{};
        std::optional<Span> loc{};
    };

    struct Function {
        std::string name;
        std::vector<std::string> param_names;
        std::vector<Instruction> instructions;
        std::vector<Value> constants;   // 로드한 상수 (중복 제거, 첫 사용 순)

        uint32_t param_count() const { return static_cast<uint32_t>(param_names.size()); }
    };

    /// @brief 컴파일 결과물. 실행 엔진의 유일한 입력.
    class Module {
    public:
        std::string entry_point = "main";

        /// @brief 같은 이름이 있으면 교체한다 (last-write-wins). 교체했으면 true.
        bool put_function(Function f) {
            auto it = index_.find(f.name);
            if (it != index_.end()) {
                functions_[it->second] = std::move(f);
                return true;
            }
            index_.emplace(f.name, static_cast<uint32_t>(functions_.size()));
            functions_.push_back(std::move(f));
            return false;
        }

        const Function* find(std::string_view name) const {
            auto it = index_.find(std::string(name));
            if (it == index_.end()) return nullptr;
            return &functions_[it->second];
        }

        bool has_entry() const { return find(entry_point) != nullptr; }

        const std::vector<Function>& functions() const { return functions_; }
        size_t size() const { return functions_.size(); }

    private:
        std::vector<Function> functions_;
        std::unordered_map<std::string, uint32_t> index_;
    };

    /// @brief 상수 값의 표시 문자열 (disasm/dump용)
    std::string value_to_string(const Value& v);

    std::string operand_to_string(const Operand& o);

} // namespace onec::bc
