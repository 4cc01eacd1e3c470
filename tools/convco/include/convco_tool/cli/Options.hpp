// tools/convco/include/convco_tool/cli/Options.hpp
#pragma once

#include <convco/diag/DiagCode.hpp>
#include <convco/parse/Parser.hpp>

#include <cstdint>
#include <ostream>
#include <string>


namespace convco_tool::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kListTypes,
        kMessage,
        kFile,
        kStdin,
    };

    struct Options {
        Mode mode = Mode::kUsage;

        std::string payload{};  // message text or file path

        convco::diag::Language lang = convco::diag::Language::kEn;
        convco::ParseOptions parse_opt{};  // sink is attached by the driver
        bool verbose = false;

        bool ok = true;
        std::string error{};
    };

    /// @brief `convco` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

} // namespace convco_tool::cli
