// core/include/convco/message/Message.hpp
#pragma once
#include <optional>
#include <string>
#include <string_view>


namespace convco {

    /// @brief 파싱된 Conventional Commit 메시지 (공개 결과).
    struct Message {
        std::string type{};
        std::optional<std::string> scope{};   // nullopt: no parentheses, "": "()"
        bool exclamation = false;
        std::string description{};
        std::optional<std::string> body{};    // nullopt: no blank line seen

        bool ok() const {  return !type.empty() && !description.empty();  }

        bool is_breaking_change() const {  return exclamation;  }

        bool has_scope() const {  return scope.has_value();  }
        bool has_body() const  {  return body.has_value();   }

        /// @brief 정규 형태로 다시 조립한다: type[(scope)][!]: description[\n\nbody]
        std::string to_string() const;

        bool operator==(const Message& o) const {
            return type == o.type && scope == o.scope && exclamation == o.exclamation &&
                   description == o.description && body == o.body;
        }
        bool operator!=(const Message& o) const {  return !(*this == o);  }
    };

    /// @brief 스캐너가 매칭한 부분 문자열을 문법 순서대로 받아 Message 로 내보낸다.
    class MessageBuilder {
    public:
        void set_type(std::string_view s)        {  type_.assign(s.data(), s.size());  }
        void set_scope(std::string_view s)       {  scope_.emplace(s.data(), s.size());  }
        void set_breaking()                      {  exclamation_ = true;  }
        void set_description(std::string_view s) {  description_.assign(s.data(), s.size());  }
        void set_body(std::string_view s)        {  body_.emplace(s.data(), s.size());  }

        /// @brief best-effort 부분 결과를 돌려줄 수 있는 최소 조건 (type, description 모두 비어 있지 않음)
        bool minimal() const {  return !type_.empty() && !description_.empty();  }

        Message export_message() const;

    private:
        std::string type_{};
        std::optional<std::string> scope_{};
        bool exclamation_ = false;
        std::string description_{};
        std::optional<std::string> body_{};
    };

} // namespace convco
