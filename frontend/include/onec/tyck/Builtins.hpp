// frontend/include/onec/tyck/Builtins.hpp
#pragma once
#include <onec/ty/Type.hpp>

#include <array>
#include <cstdint>
#include <string_view>


namespace onec::tyck {

    // 실행 엔진이 이름으로 제공하는 내장 함수들의 시그니처.
    // 리스트 핸들은 이 계층에서 Integer로 취급한다.
    enum class BuiltinTy : uint8_t {
        kInteger,
        kString,
        kBoolean,
        kVoid,
    };

    struct BuiltinSig {
        std::string_view name;
        std::array<BuiltinTy, 3> params;
        uint8_t param_count;
        BuiltinTy ret;
    };

    inline constexpr std::array<BuiltinSig, 16> k_builtin_table = {{
        // I/O
        {"print",       {BuiltinTy::kString},                                               1, BuiltinTy::kVoid},
        {"println",     {BuiltinTy::kString},                                               1, BuiltinTy::kVoid},

        // string
        {"len",         {BuiltinTy::kString},                                               1, BuiltinTy::kInteger},
        {"substr",      {BuiltinTy::kString, BuiltinTy::kInteger, BuiltinTy::kInteger},     3, BuiltinTy::kString},
        {"char_at",     {BuiltinTy::kString, BuiltinTy::kInteger},                          2, BuiltinTy::kString},
        {"str_concat",  {BuiltinTy::kString, BuiltinTy::kString},                           2, BuiltinTy::kString},
        {"str_eq",      {BuiltinTy::kString, BuiltinTy::kString},                           2, BuiltinTy::kBoolean},
        {"str_to_int",  {BuiltinTy::kString},                                               1, BuiltinTy::kInteger},
        {"int_to_str",  {BuiltinTy::kInteger},                                              1, BuiltinTy::kString},
        {"is_digit",    {BuiltinTy::kString},                                               1, BuiltinTy::kBoolean},
        {"is_alpha",    {BuiltinTy::kString},                                               1, BuiltinTy::kBoolean},
        {"is_alnum",    {BuiltinTy::kString},                                               1, BuiltinTy::kBoolean},

        // list
        {"list_append", {BuiltinTy::kInteger, BuiltinTy::kInteger},                         2, BuiltinTy::kInteger},
        {"list_get",    {BuiltinTy::kInteger, BuiltinTy::kInteger},                         2, BuiltinTy::kInteger},
        {"list_set",    {BuiltinTy::kInteger, BuiltinTy::kInteger, BuiltinTy::kInteger},    3, BuiltinTy::kInteger},

        // system
        {"exit",        {BuiltinTy::kInteger},                                              1, BuiltinTy::kVoid},
    }};

    /// @brief 내장 함수 이름인지 판정
    constexpr bool is_builtin_name(std::string_view name) {
        for (const auto& b : k_builtin_table) {
            if (b.name == name) return true;
        }
        return false;
    }

} // namespace onec::tyck
