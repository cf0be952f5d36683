// tools/onec/src/driver/Runner.hpp
#pragma once

#include "../cli/Options.hpp"

namespace onec::cli {

    /// @brief 입력 파일을 컴파일하고 바이트코드를 기록한다. 종료 코드를 반환한다.
    int run(const Options& opt);

} // namespace onec::cli
