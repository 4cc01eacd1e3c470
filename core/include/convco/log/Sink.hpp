// core/include/convco/log/Sink.hpp
#pragma once
#include <convco/diag/Diagnostic.hpp>

#include <mutex>
#include <ostream>
#include <string_view>


namespace convco::log {

    /// @brief 파서가 보내는 관찰용 이벤트의 수신자. 파싱 결과에는 영향을 주지 않는다.
    /// @details 여러 parse 호출이 하나의 Sink 를 공유할 수 있으므로 구현은 동시 호출에 안전해야 한다.
    class Sink {
    public:
        virtual ~Sink() = default;

        /// @brief 문법 요소 하나가 완성됨 (예: event="valid commit message type", key="type", value="feat")
        virtual void info(std::string_view event, std::string_view key, std::string_view value) = 0;

        /// @brief 진단이 기록될 때마다 호출된다. 이후 덮어써질 진단도 포함한다.
        virtual void error(const diag::Diagnostic& d) = 0;
    };

    /// @brief 한 줄에 이벤트 하나씩 ostream 에 출력한다.
    class StreamSink final : public Sink {
    public:
        explicit StreamSink(std::ostream& os, diag::Language lang = diag::Language::kEn)
            : os_(os), lang_(lang) {}

        void info(std::string_view event, std::string_view key, std::string_view value) override;
        void error(const diag::Diagnostic& d) override;

    private:
        std::ostream& os_;
        diag::Language lang_ = diag::Language::kEn;
        std::mutex mu_;
    };

} // namespace convco::log
