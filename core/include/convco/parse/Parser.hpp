// core/include/convco/parse/Parser.hpp
#pragma once
#include <convco/diag/Diagnostic.hpp>
#include <convco/log/Sink.hpp>
#include <convco/message/Message.hpp>
#include <convco/syntax/TypeProfile.hpp>

#include <optional>
#include <string_view>


namespace convco {

    struct ParseOptions {
        bool best_effort = false;
        syntax::TypeProfile profile = syntax::TypeProfile::kMinimal;
        log::Sink* sink = nullptr;  // optional, not owned
    };

    /// @brief 성공: message 만 존재. 실패: diagnostic 존재, best-effort + 최소 조건 충족 시 message 도 존재.
    struct ParseResult {
        std::optional<Message> message{};
        std::optional<diag::Diagnostic> diagnostic{};

        bool ok() const {  return message.has_value() && !diagnostic.has_value();  }
    };

    /// @brief 커밋 메시지 전체를 한 번의 좌→우 스캔으로 분해한다.
    /// @details 호출마다 독립된 스캔 상태를 사용하므로 서로 다른 스레드에서 동시에 호출해도 된다.
    ParseResult parse(std::string_view input, const ParseOptions& opt = {});

    /// @brief 옵션을 보관하는 재사용 가능한 파서 핸들.
    class Parser {
    public:
        Parser() = default;
        explicit Parser(ParseOptions opt) : opt_(opt) {}

        Parser& with_best_effort()                      {  opt_.best_effort = true; return *this;  }
        Parser& with_types(syntax::TypeProfile profile) {  opt_.profile = profile; return *this;    }
        Parser& with_sink(log::Sink* sink)              {  opt_.sink = sink; return *this;         }

        bool has_best_effort() const {  return opt_.best_effort;  }
        syntax::TypeProfile types() const {  return opt_.profile;  }

        const ParseOptions& options() const {  return opt_;  }

        ParseResult parse(std::string_view input) const {  return convco::parse(input, opt_);  }

    private:
        ParseOptions opt_{};
    };

} // namespace convco
