// frontend/include/onec/ty/Type.hpp
#pragma once
#include <cstdint>


namespace onec::ty {

    using TypeId = uint32_t;
    inline constexpr TypeId kInvalidType = 0xFFFF'FFFFu;

    enum class Primitive : uint8_t {
        kInteger,
        kFloat,
        kString,
        kBoolean,
    };

    enum class Kind : uint8_t {
        kPrimitive,
        kList,      // List<T>
        kFn,        // (T1, T2, ...) -> R
        kVoid,
    };

    struct Type {
        Kind kind = Kind::kVoid;

        // kPrimitive
        Primitive prim = Primitive::kInteger;

        // kList
        TypeId elem = kInvalidType;

        // kFn: params = TypePool::fn_params_ slice
        TypeId ret = kInvalidType;
        uint32_t param_begin = 0;
        uint32_t param_count = 0;
    };

} // namespace onec::ty
