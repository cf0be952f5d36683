// frontend/src/text/source_manager.cpp
#include <onec/text/SourceManager.hpp>

#include <algorithm>


namespace onec {

    uint32_t SourceManager::count_code_points(std::string_view s, uint32_t byte_lo, uint32_t byte_hi) {
        uint32_t n = 0;
        for (uint32_t i = byte_lo; i < byte_hi && i < s.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            if ((c & 0xC0) != 0x80) ++n;
        }
        return n;
    }

    std::vector<uint32_t> SourceManager::build_line_starts(std::string_view s) {
        std::vector<uint32_t> starts;
        starts.push_back(0);

        for (uint32_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts.push_back(i + 1);
        }
        return starts;
    }

    uint32_t SourceManager::line_index_from_byte(const File& f, uint32_t byte_off) {
        const auto& starts = f.line_starts;
        auto it = std::upper_bound(starts.begin(), starts.end(), byte_off);
        return (it == starts.begin()) ? 0 : static_cast<uint32_t>((it - starts.begin()) - 1);
    }

    uint32_t SourceManager::line_end_byte(const File& f, uint32_t line_index) {
        if (line_index + 1 < f.line_starts.size()) return f.line_starts[line_index + 1] - 1;
        return static_cast<uint32_t>(f.content.size());
    }

    uint32_t SourceManager::add(std::string name, std::string content) {
        File f;
        f.name = std::move(name);
        f.content = std::move(content);
        f.line_starts = build_line_starts(f.content);
        files_.push_back(std::move(f));

        return static_cast<uint32_t>(files_.size() - 1);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        if (!has(file_id)) return "<program>";
        return files_[file_id].name;
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        if (!has(file_id)) return {};
        return files_[file_id].content;
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        LineCol lc;
        if (!has(file_id)) return lc;

        const auto& f = files_[file_id];
        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(f.content.size()));
        const uint32_t idx = line_index_from_byte(f, off);

        lc.line = idx + 1;
        lc.col  = count_code_points(f.content, f.line_starts[idx], off) + 1;
        return lc;
    }

    std::string SourceManager::location_string(const Span& sp) const {
        std::string out(name(sp.file_id));
        out += ":";
        out += std::to_string(sp.line);
        out += ":";
        out += std::to_string(sp.col);
        return out;
    }

    Snippet SourceManager::snippet_for_span(const Span& sp) const {
        Snippet sn;
        sn.line_no = sp.line;
        sn.col = sp.col;
        if (!has(sp.file_id)) return sn;

        const auto& f = files_[sp.file_id];
        const uint32_t size = static_cast<uint32_t>(f.content.size());
        const uint32_t lo = std::min<uint32_t>(sp.lo, size);
        const uint32_t hi = std::min<uint32_t>(sp.hi, size);

        const uint32_t idx = line_index_from_byte(f, lo);
        const uint32_t line_start = f.line_starts[idx];
        const uint32_t line_end = line_end_byte(f, idx);

        // 단일 줄 스니펫: highlight는 현재 줄 안으로 자른다
        const uint32_t hi_clamped = std::max<uint32_t>(lo, std::min<uint32_t>(hi, line_end));

        sn.line_text = std::string_view(f.content).substr(line_start, line_end - line_start);
        sn.line_no = idx + 1;
        sn.caret_cols_before = count_code_points(f.content, line_start, lo);
        sn.caret_cols_len = count_code_points(f.content, lo, hi_clamped);
        if (sn.caret_cols_len == 0) sn.caret_cols_len = 1;
        return sn;
    }

    SnippetBlock SourceManager::snippet_block_for_span(const Span& sp, uint32_t context_lines) const {
        SnippetBlock blk;
        if (!has(sp.file_id)) return blk;

        const auto& f = files_[sp.file_id];
        const Snippet one = snippet_for_span(sp);
        const uint32_t idx = one.line_no - 1;
        const uint32_t line_count = static_cast<uint32_t>(f.line_starts.size());

        const uint32_t first = (idx >= context_lines) ? (idx - context_lines) : 0;
        const uint32_t last = std::min<uint32_t>(idx + context_lines, line_count - 1);

        for (uint32_t i = first; i <= last; ++i) {
            const uint32_t b = f.line_starts[i];
            const uint32_t e = line_end_byte(f, i);
            blk.lines.push_back(std::string_view(f.content).substr(b, e - b));
        }

        blk.first_line_no = first + 1;
        blk.caret_line_offset = idx - first;
        blk.caret_cols_before = one.caret_cols_before;
        blk.caret_cols_len = one.caret_cols_len;
        blk.col = one.col;
        return blk;
    }

} // namespace onec
