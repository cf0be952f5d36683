// tools/onec/src/cli/Options.hpp
#pragma once

#include <onec/diag/DiagCode.hpp>

#include <cstdint>
#include <ostream>
#include <string>


namespace onec::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kCompile,
    };

    struct Options {
        Mode mode = Mode::kUsage;

        std::string input_path{};
        std::string output_path{};      // 비어 있으면 입력 경로의 확장자를 .1bc로 바꾼다
        std::string entry_point = "main";

        bool verbose = false;           // -v : 단계 진행 출력
        bool dump = false;              // -d : 토큰/AST 덤프
        bool disasm = false;            // -t : 디스어셈블 출력

        diag::Language lang = diag::Language::kEn;
        uint32_t context_lines = 2;

        bool ok = true;
        std::string error{};
    };

    /// @brief `onec` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    /// @details 예외를 던지지 않는다. 잘못된 인자는 ok=false + error로 돌려준다.
    Options parse_options(int argc, char** argv);

    /// @brief 실제로 쓸 출력 경로 (-o가 없으면 기본 경로)
    std::string resolved_output_path(const Options& opt);

} // namespace onec::cli
