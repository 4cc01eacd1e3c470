// core/include/convco/fsm/Automaton.hpp
#pragma once
#include <convco/syntax/KeywordTable.hpp>

#include <cstdint>


namespace convco::fsm {

    /// @brief 헤더+본문 문법 위의 위치. kType 에서는 KeywordNode 가 함께 쓰인다.
    enum class State : uint8_t {
        kStart,             // first keyword byte expected
        kType,              // inside the keyword automaton
        kBang,              // after '!'; ':' required
        kScopeOpen,         // after '('
        kScopeText,         // inside scope text
        kScopeClose,        // after ')'; '!' or ':' required
        kColon,             // after ':'; ' ' required
        kSpaces,            // skipping spaces before the description
        kDescription,       // accepting
        kDescriptionEnd,    // after the description's CR/LF; blank line required
        kBlankLine,         // accepting, empty body
        kBody,              // accepting
        kSink,              // error; no outgoing edges
    };

    /// @brief 간선에 붙는 동작. 캡처 동작과 기본(no match) 간선의 진단 동작으로 나뉜다.
    enum class Action : uint8_t {
        kNone,

        kMarkToken,             // token_start = pos
        kSetBreaking,
        kEmitEmptyScope,        // ')' right after '('
        kEmitScope,
        kEmitDescription,
        kMarkBody,

        kFailIllegalTypeChar,
        kFailMissingColon,
        kFailMalformedScope,
        kFailMissingDescriptionInitialSpace,
        kFailEmptyDescription,  // IllegalNewline on LF, MissingDescription otherwise
        kFailMissingBlankLine,
    };

    /// @brief 상태를 떠날 때 간선 동작보다 먼저 실행되는 동작.
    enum class LeaveAction : uint8_t {
        kNone,
        kEmitType,              // leaving a terminal keyword node
    };

    struct Step {
        State next = State::kSink;
        syntax::KeywordNode node = syntax::k_no_node;
        Action action = Action::kNone;
        LeaveAction leave = LeaveAction::kNone;
    };

    /// @brief 전이 함수: (state, node, byte) -> (next, node, action)
    Step step(State s, syntax::KeywordNode node, const syntax::KeywordTable& table, unsigned char c);

    /// @brief 이 상태 다음에 최소 한 바이트가 더 와야 하는가 (truncation advisory 대상).
    bool requires_lookahead(State s, syntax::KeywordNode node, const syntax::KeywordTable& table);

    bool is_accepting(State s);

} // namespace convco::fsm
