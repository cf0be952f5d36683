// frontend/include/onec/text/Span.hpp
#pragma once
#include <cstdint>


namespace onec {

    /// @brief 소스 파일 내 위치. [lo, hi) 바이트 범위 + lo의 1-based line/col.
    /// @details col은 코드포인트 단위로 센다. line/col은 lexer가 스캔하면서 채운다.
    struct Span {
        uint32_t file_id = 0;
        uint32_t lo = 0;
        uint32_t hi = 0;
        uint32_t line = 1;
        uint32_t col = 1;
    };

    /// @brief 두 span을 덮는 span (a의 시작 위치 유지)
    inline Span span_join(Span a, Span b) {
        Span s = a;
        if (b.hi > s.hi) s.hi = b.hi;
        return s;
    }

} // namespace onec
