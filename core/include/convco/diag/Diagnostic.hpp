// core/include/convco/diag/Diagnostic.hpp
#pragma once
#include <convco/diag/DiagCode.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace convco::diag {

    class Diagnostic {
    public:
        Diagnostic(Code code, uint32_t column)
            : code_(code), column_(column) {}

        void add_arg(std::string_view s) {  args_.emplace_back(s);  }

        Code code() const           {  return code_;    }
        uint32_t column() const     {  return column_;  }
        const std::vector<std::string>& args() const {  return args_;  }

        /// @brief 영어 카탈로그로 렌더링한 메시지 (예: "early exit after '!' character: col=04")
        std::string message() const;

    private:
        Code code_{Code::kEmptyInput};
        uint32_t column_ = 0; // byte offset reported as "col"
        std::vector<std::string> args_;
    };

} // namespace convco::diag
