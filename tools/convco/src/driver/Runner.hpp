// tools/convco/src/driver/Runner.hpp
#pragma once

#include <convco_tool/cli/Options.hpp>

namespace convco_tool::driver {

    /// @brief 입력을 읽어 파싱하고 결과/진단을 출력한다. 종료 코드를 반환한다.
    int run(const cli::Options& opt);

} // namespace convco_tool::driver
