// frontend/include/onec/bc/Serialize.hpp
#pragma once
#include <onec/bc/Bytecode.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace onec::bc {

    // "1BC\0" + u16 format version, little-endian, length-prefixed
    inline constexpr uint8_t k_magic[4] = {'1', 'B', 'C', 0};
    inline constexpr uint16_t k_format_version = 1;

    std::vector<uint8_t> serialize(const Module& m);

    /// @brief 바이트열을 모듈로 복원. 실패 시 false + err.
    bool deserialize(const std::vector<uint8_t>& bytes, Module& out, std::string& err);

} // namespace onec::bc
