// frontend/include/onec/driver/Compile.hpp
#pragma once
#include <onec/bc/Bytecode.hpp>
#include <onec/diag/Diagnostic.hpp>
#include <onec/text/SourceManager.hpp>
#include <onec/tyck/TypeCheck.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace onec::driver {

    struct CompileOptions {
        std::string entry_point = "main";
        bool check_types = true;
    };

    /// @brief 파이프라인 한 번의 결과.
    /// @details 실패하면 failed_stage에 첫 실패 단계가 남고, bag에 그 단계의 진단이 있다.
    ///          sources는 진단 렌더링에 필요하므로 결과와 함께 넘겨준다.
    struct CompileResult {
        bool ok = false;
        std::optional<diag::Stage> failed_stage{};

        bc::Module module{};
        diag::Bag bag{};
        std::vector<tyck::TyError> type_errors{};

        SourceManager sources{};
        uint32_t file_id = 0;
    };

    /// @brief lex -> parse -> check -> generate. 단계마다 새 인스턴스를 만들고
    ///        첫 실패 단계에서 멈춘다.
    CompileResult compile(std::string_view source, std::string name, const CompileOptions& opt = {});

} // namespace onec::driver
