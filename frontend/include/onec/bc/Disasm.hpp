// frontend/include/onec/bc/Disasm.hpp
#pragma once
#include <onec/bc/Bytecode.hpp>

#include <string>


namespace onec::bc {

    std::string disassemble_function(const Function& f);

    /// @brief "Bytecode Module:" 헤더 + 엔트리 + 함수별 목록
    std::string disassemble_module(const Module& m);

} // namespace onec::bc
