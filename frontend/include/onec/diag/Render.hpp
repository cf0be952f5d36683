// frontend/include/onec/diag/Render.hpp
#pragma once
#include <onec/diag/Diagnostic.hpp>
#include <onec/text/SourceManager.hpp>

#include <string>


namespace onec::diag {

    std::string code_name(Code c);

    /// @brief 인자가 치환된 사람이 읽을 메시지
    std::string render_message(const Diagnostic& d, Language lang);

    /// @brief "name:line:col" 위치 문자열
    std::string render_location(const Diagnostic& d, const SourceManager& sm);

    /// @brief "LexError: msg at name:line:col" 형태의 한 줄 요약
    std::string render_brief(const Diagnostic& d, Language lang, const SourceManager& sm);

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm);

    /// @brief 진단을 렌더링하되, 에러 라인 주변 컨텍스트를 함께 출력
    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines);

} // namespace onec::diag
