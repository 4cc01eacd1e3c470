// core/include/convco/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace convco::diag {

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    enum class Code : uint16_t {
        // ---- type keyword ----
        kIllegalTypeChar,               // byte outside the active keyword table
        kIncompleteType,                // input ended inside a keyword
        kMissingColon,                  // keyword/scope/'!' not followed by ':'

        // ---- scope ----
        kMalformedScope,                // '(' inside a scope

        // ---- input shape ----
        kEmptyInput,
        kEarlyExit,                     // truncation advisory

        // ---- description ----
        kMissingDescriptionInitialSpace,// ':' not followed by ' '
        kMissingDescription,            // description empty (CR or end of input)
        kIllegalNewline,                // description empty (LF)

        // ---- body ----
        kMissingBlankLineAtBodyBegin,
    };

    /// @brief 진단 코드의 안정적인 이름(예: "MissingColon")을 반환한다.
    const char* code_name(Code c);

} // namespace convco::diag
