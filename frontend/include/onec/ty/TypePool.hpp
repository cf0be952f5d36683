// frontend/include/onec/ty/TypePool.hpp
#pragma once
#include <onec/ty/Type.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace onec::ty {

    /// @brief 타입 intern 풀. 같은 구조의 타입은 같은 TypeId를 가진다.
    /// @details 따라서 구조적 동등성 비교는 TypeId 비교로 충분하다.
    class TypePool {
    public:
        TypePool() {
            int_id_   = push_(make_prim_(Primitive::kInteger));
            float_id_ = push_(make_prim_(Primitive::kFloat));
            str_id_   = push_(make_prim_(Primitive::kString));
            bool_id_  = push_(make_prim_(Primitive::kBoolean));

            Type v{};
            v.kind = Kind::kVoid;
            void_id_ = push_(v);
        }

        TypeId integer() const { return int_id_; }
        TypeId float_() const { return float_id_; }
        TypeId string() const { return str_id_; }
        TypeId boolean() const { return bool_id_; }
        TypeId void_() const { return void_id_; }

        const Type& get(TypeId id) const { return types_[id]; }
        uint32_t count() const { return static_cast<uint32_t>(types_.size()); }

        /// @brief 이름 -> primitive/Void. 모르는 이름이면 false.
        bool lookup_name(std::string_view name, TypeId& out) const {
            if (name == "Integer") { out = int_id_; return true; }
            if (name == "Float") { out = float_id_; return true; }
            if (name == "String") { out = str_id_; return true; }
            if (name == "Boolean") { out = bool_id_; return true; }
            if (name == "Void") { out = void_id_; return true; }
            return false;
        }

        TypeId make_list(TypeId elem) {
            for (TypeId i = 0; i < count(); ++i) {
                const auto& t = types_[i];
                if (t.kind == Kind::kList && t.elem == elem) return i;
            }
            Type t{};
            t.kind = Kind::kList;
            t.elem = elem;
            return push_(t);
        }

        TypeId make_fn(TypeId ret, const TypeId* params, uint32_t param_count) {
            for (TypeId i = 0; i < count(); ++i) {
                const auto& t = types_[i];
                if (t.kind != Kind::kFn || t.ret != ret || t.param_count != param_count) continue;

                bool same = true;
                for (uint32_t k = 0; k < param_count; ++k) {
                    if (fn_params_[t.param_begin + k] != params[k]) { same = false; break; }
                }
                if (same) return i;
            }

            Type t{};
            t.kind = Kind::kFn;
            t.ret = ret;
            t.param_begin = static_cast<uint32_t>(fn_params_.size());
            t.param_count = param_count;
            for (uint32_t k = 0; k < param_count; ++k) fn_params_.push_back(params[k]);
            return push_(t);
        }

        TypeId make_fn(TypeId ret, const std::vector<TypeId>& params) {
            return make_fn(ret, params.data(), static_cast<uint32_t>(params.size()));
        }

        bool is_fn(TypeId id) const { return id < count() && types_[id].kind == Kind::kFn; }
        bool is_list(TypeId id) const { return id < count() && types_[id].kind == Kind::kList; }

        std::string to_string(TypeId id) const {
            if (id >= count()) return "<invalid>";

            const auto& t = types_[id];
            switch (t.kind) {
                case Kind::kPrimitive:
                    switch (t.prim) {
                        case Primitive::kInteger: return "Integer";
                        case Primitive::kFloat: return "Float";
                        case Primitive::kString: return "String";
                        case Primitive::kBoolean: return "Boolean";
                    }
                    return "Integer";
                case Kind::kVoid:
                    return "Void";
                case Kind::kList:
                    return "List<" + to_string(t.elem) + ">";
                case Kind::kFn: {
                    std::string s = "(";
                    for (uint32_t k = 0; k < t.param_count; ++k) {
                        if (k) s += ", ";
                        s += to_string(fn_params_[t.param_begin + k]);
                    }
                    s += ") -> ";
                    s += to_string(t.ret);
                    return s;
                }
            }
            return "<invalid>";
        }

    private:
        static Type make_prim_(Primitive p) {
            Type t{};
            t.kind = Kind::kPrimitive;
            t.prim = p;
            return t;
        }

        TypeId push_(const Type& t) {
            types_.push_back(t);
            return static_cast<TypeId>(types_.size() - 1);
        }

        std::vector<Type> types_;
        std::vector<TypeId> fn_params_;

        TypeId int_id_ = kInvalidType;
        TypeId float_id_ = kInvalidType;
        TypeId str_id_ = kInvalidType;
        TypeId bool_id_ = kInvalidType;
        TypeId void_id_ = kInvalidType;
    };

} // namespace onec::ty
