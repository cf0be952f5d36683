// frontend/include/onec/text/SourceManager.hpp
#pragma once
#include <onec/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace onec {

    struct LineCol {
        uint32_t line = 1; // 1-based
        uint32_t col  = 1; // 1-based, code points
    };

    struct Snippet {
        std::string_view line_text{};
        uint32_t line_no = 1;           // 1-based
        uint32_t col = 1;               // 1-based
        uint32_t caret_cols_before = 0; // number of spaces before '^'
        uint32_t caret_cols_len = 1;    // number of '^'
    };

    struct SnippetBlock {
        uint32_t first_line_no = 1;             // 1-based
        std::vector<std::string_view> lines;    // [first_line_no ...]
        uint32_t caret_line_offset = 0;         // lines[]에서 캐럿이 찍힐 줄 (0-based)
        uint32_t caret_cols_before = 0;
        uint32_t caret_cols_len = 1;
        uint32_t col = 1;
    };

    class SourceManager {
    public:
        // 파일(또는 문자열 버퍼)을 등록하고 file_id를 반환
        uint32_t add(std::string name, std::string content);

        bool has(uint32_t file_id) const { return file_id < files_.size(); }
        size_t size() const { return files_.size(); }

        std::string_view name(uint32_t file_id) const;
        std::string_view content(uint32_t file_id) const;

        // byte_off -> (line, col)
        LineCol line_col(uint32_t file_id, uint32_t byte_off) const;

        /// @brief "name:line:col" 위치 문자열. 미등록 file_id는 "<program>" 이름을 쓴다.
        std::string location_string(const Span& sp) const;

        Snippet snippet_for_span(const Span& sp) const;

        /// @brief span 기준으로 여러 줄 컨텍스트 스니펫을 생성한다.
        /// @param context_lines 위/아래로 추가로 보여줄 줄 수 (예: 2)
        SnippetBlock snippet_block_for_span(const Span& sp, uint32_t context_lines) const;

    private:
        struct File {
            std::string name;
            std::string content;
            std::vector<uint32_t> line_starts; // byte offsets, includes 0
        };

        static std::vector<uint32_t> build_line_starts(std::string_view s);

        // UTF-8 continuation 바이트를 제외한 글자 수
        static uint32_t count_code_points(std::string_view s, uint32_t byte_lo, uint32_t byte_hi);

        static uint32_t line_index_from_byte(const File& f, uint32_t byte_off);
        static uint32_t line_end_byte(const File& f, uint32_t line_index);

        std::vector<File> files_;
    };

} // namespace onec
