// core/include/convco/syntax/KeywordTable.hpp
#pragma once
#include <convco/syntax/TypeProfile.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace convco::syntax {

    using KeywordNode = uint16_t;

    inline constexpr KeywordNode k_no_node = 0xFFFF;

    /// @brief 타입 키워드용 최소 비순환 오토마톤(DAFSA).
    /// @details 같은 접미사를 가진 키워드("revert", "refactor")는 꼬리 노드를 공유하고,
    ///          모든 키워드는 하나의 종료 노드로 모인다. 입력 한 바이트당 테이블 조회 한 번.
    class KeywordTable {
    public:
        struct Node {
            bool terminal = false;
            std::array<KeywordNode, 26> edges{};  // 'a'..'z', 0 = no edge (root is never a target)
        };

        /// @param sorted_words 사전순으로 정렬된, 소문자 ASCII 키워드 목록
        explicit KeywordTable(const std::vector<std::string_view>& sorted_words);

        KeywordNode root() const {  return 0;  }

        /// @brief node 에서 byte 로 가는 간선. 없으면 k_no_node.
        KeywordNode next(KeywordNode node, unsigned char byte) const;

        bool is_terminal(KeywordNode node) const {  return nodes_[node].terminal;  }

        size_t node_count() const {  return nodes_.size();  }

        bool contains(std::string_view word) const;

        const std::vector<std::string>& keywords() const {  return keywords_;  }

    private:
        std::vector<Node> nodes_;
        std::vector<std::string> keywords_;
    };

    /// @brief profile 에 해당하는 테이블. 최초 호출 시 한 번만 만들어지며 이후 불변이다.
    const KeywordTable& keyword_table(TypeProfile profile);

} // namespace convco::syntax
