// frontend/include/onec/ast/Nodes.hpp
#pragma once
#include <onec/syntax/TokenKind.hpp>
#include <onec/text/Span.hpp>

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace onec::ast {

    using ExprId = uint32_t;
    using StmtId = uint32_t;
    using TypeAnnId = uint32_t;

    inline constexpr ExprId k_invalid_expr = 0xFFFF'FFFFu;
    inline constexpr StmtId k_invalid_stmt = 0xFFFF'FFFFu;
    inline constexpr TypeAnnId k_invalid_type_ann = 0xFFFF'FFFFu;
    inline constexpr uint32_t k_no_meta = 0xFFFF'FFFFu;

    enum class ExprKind : uint8_t {
        kError,

        kIntLit,
        kFloatLit,
        kStringLit,
        kBoolLit,
        kNullLit,

        kIdent,
        kUnary,     // op a
        kBinary,    // a op b
        kCall,      // a(args...)
        kMember,    // a.text
        kIndex,     // a[b]
        kListLit,   // [args...]
    };

    enum class StmtKind : uint8_t {
        kError,

        kProgram,   // children = function decls
        kFnDecl,
        kBlock,

        kExprStmt,
        kAssign,    // target op= expr
        kReturn,    // expr may be k_invalid_expr
        kIf,        // expr : a [else b]
        kEnsure,    // expr : a [otherwise b]
        kWhile,     // expr : a
        kBreak,
        kContinue,
    };

    /// @brief 타입 주석. `Name` 또는 `Name<T, ...>`. where 절은 보존하지 않는다.
    struct TypeAnn {
        std::string_view name{};
        Span span{};

        // args: type_ann_args_ slice
        uint32_t arg_begin = 0;
        uint32_t arg_count = 0;
    };

    struct Param {
        std::string_view name{};
        TypeAnnId type = k_invalid_type_ann;
        Span span{};
        uint32_t meta = k_no_meta;
    };

    struct Requirement {
        std::string_view text{};   // 공백으로 이은 설명 (owned)
        Span span{};
    };

    struct Expr {
        ExprKind kind = ExprKind::kError;
        Span span{};

        // unary/binary 연산자
        syntax::TokenKind op = syntax::TokenKind::kError;

        ExprId a = k_invalid_expr;
        ExprId b = k_invalid_expr;

        // ident 이름 / member 이름 / 리터럴 원문
        std::string_view text{};

        // 디코딩된 리터럴 값
        int64_t int_value = 0;
        double float_value = 0.0;
        bool bool_value = false;
        std::string_view string_value{};   // owned by arena

        // call args / list elements: expr_args_ slice
        uint32_t arg_begin = 0;
        uint32_t arg_count = 0;

        uint32_t meta = k_no_meta;
    };

    struct Stmt {
        StmtKind kind = StmtKind::kError;
        Span span{};

        // return value / condition / expr-stmt / assign value
        ExprId expr = k_invalid_expr;
        // assign target
        ExprId target = k_invalid_expr;
        // assign operator (= += -= *= /=)
        syntax::TokenKind op = syntax::TokenKind::kError;

        // fn body / then / loop body
        StmtId a = k_invalid_stmt;
        // else / otherwise
        StmtId b = k_invalid_stmt;

        // block/program children: stmt_children_ slice
        uint32_t stmt_begin = 0;
        uint32_t stmt_count = 0;

        // fn decl
        std::string_view name{};
        uint32_t input_begin = 0;
        uint32_t input_count = 0;
        uint32_t output_begin = 0;
        uint32_t output_count = 0;
        uint32_t req_begin = 0;
        uint32_t req_count = 0;

        uint32_t meta = k_no_meta;
    };

    /// @brief 노드별 메타데이터. 코어 단계는 읽지도 쓰지도 않는다(툴링용).
    struct Meta {
        std::vector<std::pair<std::string, std::string>> entries;
    };

    class AstArena {
    public:
        ExprId add_expr(const Expr& e) {
            exprs_.push_back(e);
            return static_cast<ExprId>(exprs_.size() - 1);
        }

        StmtId add_stmt(const Stmt& s) {
            stmts_.push_back(s);
            return static_cast<StmtId>(stmts_.size() - 1);
        }

        uint32_t add_arg(ExprId e) {
            expr_args_.push_back(e);
            return static_cast<uint32_t>(expr_args_.size() - 1);
        }

        uint32_t add_stmt_child(StmtId s) {
            stmt_children_.push_back(s);
            return static_cast<uint32_t>(stmt_children_.size() - 1);
        }

        uint32_t add_param(const Param& p) {
            params_.push_back(p);
            return static_cast<uint32_t>(params_.size() - 1);
        }

        uint32_t add_requirement(const Requirement& r) {
            reqs_.push_back(r);
            return static_cast<uint32_t>(reqs_.size() - 1);
        }

        TypeAnnId add_type_ann(const TypeAnn& t) {
            type_anns_.push_back(t);
            return static_cast<TypeAnnId>(type_anns_.size() - 1);
        }

        uint32_t add_type_ann_arg(TypeAnnId t) {
            type_ann_args_.push_back(t);
            return static_cast<uint32_t>(type_ann_args_.size() - 1);
        }

        /// @brief 문자열을 arena가 소유하도록 복사하고 안정적인 view를 반환
        std::string_view add_owned_string(std::string s) {
            owned_strings_.push_back(std::move(s));
            return owned_strings_.back();
        }

        const Expr& expr(ExprId id) const { return exprs_[id]; }
        const Stmt& stmt(StmtId id) const { return stmts_[id]; }

        const std::vector<Expr>& exprs() const { return exprs_; }
        const std::vector<Stmt>& stmts() const { return stmts_; }
        const std::vector<ExprId>& expr_args() const { return expr_args_; }
        const std::vector<StmtId>& stmt_children() const { return stmt_children_; }
        const std::vector<Param>& params() const { return params_; }
        const std::vector<Requirement>& requirements() const { return reqs_; }
        const std::vector<TypeAnn>& type_anns() const { return type_anns_; }
        const std::vector<TypeAnnId>& type_ann_args() const { return type_ann_args_; }

        // ---- metadata slot ----
        void set_expr_meta(ExprId id, std::string key, std::string value) {
            set_meta_(exprs_[id].meta, std::move(key), std::move(value));
        }
        void set_stmt_meta(StmtId id, std::string key, std::string value) {
            set_meta_(stmts_[id].meta, std::move(key), std::move(value));
        }
        std::string_view expr_meta(ExprId id, std::string_view key) const {
            return find_meta_(exprs_[id].meta, key);
        }
        std::string_view stmt_meta(StmtId id, std::string_view key) const {
            return find_meta_(stmts_[id].meta, key);
        }

    private:
        void set_meta_(uint32_t& slot, std::string key, std::string value) {
            if (slot == k_no_meta) {
                metas_.emplace_back();
                slot = static_cast<uint32_t>(metas_.size() - 1);
            }
            for (auto& kv : metas_[slot].entries) {
                if (kv.first == key) {
                    kv.second = std::move(value);
                    return;
                }
            }
            metas_[slot].entries.emplace_back(std::move(key), std::move(value));
        }

        std::string_view find_meta_(uint32_t slot, std::string_view key) const {
            if (slot == k_no_meta) return {};
            for (const auto& kv : metas_[slot].entries) {
                if (kv.first == key) return kv.second;
            }
            return {};
        }

        std::vector<Expr> exprs_;
        std::vector<Stmt> stmts_;
        std::vector<ExprId> expr_args_;
        std::vector<StmtId> stmt_children_;
        std::vector<Param> params_;
        std::vector<Requirement> reqs_;
        std::vector<TypeAnn> type_anns_;
        std::vector<TypeAnnId> type_ann_args_;
        std::vector<Meta> metas_;

        // deque: push_back 시 기존 원소 주소가 유지된다
        std::deque<std::string> owned_strings_;
    };

} // namespace onec::ast
