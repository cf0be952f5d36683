// frontend/src/os/file.cpp
#include <onec/os/File.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>


namespace onec {

    static void normalize_newlines_inplace(std::string& s) {
        // CRLF -> LF, 단독 CR 제거
        std::string out;
        out.reserve(s.size());

        for (char c : s) {
            if (c == '\r') continue;
            out.push_back(c);
        }

        s.swap(out);
    }

    static bool read_all_(const std::string& path, std::string& out, std::string& out_error) {
        std::FILE* fp = std::fopen(path.c_str(), "rb");
        if (!fp) {
            out_error = std::string("CANNOT open file: ") + std::strerror(errno);
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "파일 크기를 읽을 수 없습니다.";
            return false;
        }

        out.resize(static_cast<size_t>(sz));
        size_t n = std::fread(out.data(), 1, out.size(), fp);
        std::fclose(fp);

        if (n != out.size()) {
            out_error = "파일 읽기 중 일부만 읽혔습니다.";
            return false;
        }
        return true;
    }

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        if (!read_all_(path, out_content, out_error)) return false;

        normalize_newlines_inplace(out_content);
        return true;
    }

    bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out_bytes, std::string& out_error) {
        out_error.clear();
        out_bytes.clear();

        std::string raw;
        if (!read_all_(path, raw, out_error)) return false;

        out_bytes.assign(raw.begin(), raw.end());
        return true;
    }

    bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& bytes, std::string& out_error) {
        out_error.clear();

        std::FILE* fp = std::fopen(path.c_str(), "wb");
        if (!fp) {
            out_error = std::string("CANNOT write file: ") + std::strerror(errno);
            return false;
        }

        size_t n = bytes.empty() ? 0 : std::fwrite(bytes.data(), 1, bytes.size(), fp);
        const bool closed = (std::fclose(fp) == 0);

        if (n != bytes.size() || !closed) {
            out_error = "파일 쓰기 중 일부만 기록되었습니다.";
            return false;
        }
        return true;
    }

    std::string replace_extension(const std::string& path, const std::string& ext) {
        const size_t slash = path.find_last_of("/\\");
        const size_t dot = path.find_last_of('.');

        // 디렉토리 부분의 '.'이나 숨김 파일의 선행 '.'은 확장자가 아니다
        const size_t stem_begin = (slash == std::string::npos) ? 0 : slash + 1;
        if (dot == std::string::npos || dot <= stem_begin) return path + ext;

        return path.substr(0, dot) + ext;
    }

} // namespace onec
