// frontend/include/onec/os/File.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>


namespace onec {

    /// @brief 파일을 열어서 내용을 문자열로 변환 (텍스트 모드)
    /// @details 내부에서 CRLF 정규화(\r\n -> \n, \r -> 제거) 수행
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

    /// @brief 바이트열을 파일에 그대로 쓴다 (기존 파일은 덮어씀)
    bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& bytes, std::string& out_error);

    /// @brief 바이트열 전체를 읽는다 (정규화 없음)
    bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out_bytes, std::string& out_error);

    /// @brief 입력 경로의 확장자를 바꾼 경로 ("a/b.one" + ".1bc" -> "a/b.1bc")
    std::string replace_extension(const std::string& path, const std::string& ext);

} // namespace onec
