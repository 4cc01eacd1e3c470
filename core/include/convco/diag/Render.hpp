// core/include/convco/diag/Render.hpp
#pragma once
#include <convco/diag/Diagnostic.hpp>

#include <string>
#include <string_view>


namespace convco::diag {

    /// @brief 메시지 템플릿에 인자를 채우고 ": col=NN" 위치 꼬리를 붙인다.
    std::string render_message(const Diagnostic& d, Language lang);

    /// @brief 진단을 렌더링하되, 문제 바이트가 포함된 줄과 caret(^)을 함께 출력
    std::string render_one(
        const Diagnostic& d,
        Language lang,
        std::string_view source,
        std::string_view source_name = "<message>"
    );

    /// @brief 진단 인자로 쓸 바이트 표기. 0x80 이상은 Latin-1 코드포인트를 UTF-8로 인코딩한다.
    std::string char_arg(unsigned char b);

} // namespace convco::diag
