// frontend/include/onec/bc/Verify.hpp
#pragma once
#include <onec/bc/Bytecode.hpp>

#include <string>
#include <vector>


namespace onec::bc {

    struct VerifyError {
        std::string function;
        uint32_t index = 0;
        std::string msg;
    };

    /// @brief 모듈 구조 검사.
    /// - 남은 Label operand 없음
    /// - 점프 대상이 [0, size] 범위
    /// - operand 형태가 opcode와 일치
    /// - 모든 함수가 RETURN으로 끝남
    std::vector<VerifyError> verify(const Module& m);

} // namespace onec::bc
