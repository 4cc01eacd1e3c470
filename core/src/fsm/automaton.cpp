// core/src/fsm/automaton.cpp
#include <convco/fsm/Automaton.hpp>


namespace convco::fsm {

    namespace {

        constexpr unsigned char kLf = '\n';
        constexpr unsigned char kCr = '\r';

        bool is_line_end(unsigned char c) {
            return c == kLf || c == kCr;
        }

        Step to(State next, Action a = Action::kNone) {
            Step s{};
            s.next = next;
            s.action = a;
            return s;
        }

        Step fail(Action a) {
            return to(State::kSink, a);
        }

        /// @brief 완성된 키워드 뒤: '!' | '(' | ':'
        Step step_after_keyword(unsigned char c) {
            Step s{};
            switch (c) {
                case '!': s = to(State::kBang, Action::kSetBreaking); break;
                case '(': s = to(State::kScopeOpen); break;
                case ':': s = to(State::kColon); break;
                default:  s = fail(Action::kFailMissingColon); break;
            }
            s.leave = LeaveAction::kEmitType;
            return s;
        }

        Step step_type(syntax::KeywordNode node, const syntax::KeywordTable& table, unsigned char c) {
            const syntax::KeywordNode child = table.next(node, c);
            if (child != syntax::k_no_node) {
                Step s = to(State::kType);
                s.node = child;
                return s;
            }

            if (table.is_terminal(node)) return step_after_keyword(c);
            return fail(Action::kFailIllegalTypeChar);
        }

    } // namespace

    Step step(State s, syntax::KeywordNode node, const syntax::KeywordTable& table, unsigned char c) {
        switch (s) {
            case State::kStart: {
                const syntax::KeywordNode child = table.next(table.root(), c);
                if (child == syntax::k_no_node) return fail(Action::kFailIllegalTypeChar);

                Step st = to(State::kType, Action::kMarkToken);
                st.node = child;
                return st;
            }

            case State::kType:
                return step_type(node, table, c);

            case State::kBang:
                if (c == ':') return to(State::kColon);
                return fail(Action::kFailMissingColon);

            case State::kScopeOpen:
                if (c == '(') return fail(Action::kFailMalformedScope);
                if (c == ')') return to(State::kScopeClose, Action::kEmitEmptyScope);
                return to(State::kScopeText, Action::kMarkToken);

            case State::kScopeText:
                if (c == '(') return fail(Action::kFailMalformedScope);
                if (c == ')') return to(State::kScopeClose, Action::kEmitScope);
                return to(State::kScopeText);

            case State::kScopeClose:
                if (c == '!') return to(State::kBang, Action::kSetBreaking);
                if (c == ':') return to(State::kColon);
                return fail(Action::kFailMissingColon);

            case State::kColon:
                if (c == ' ') return to(State::kSpaces);
                return fail(Action::kFailMissingDescriptionInitialSpace);

            case State::kSpaces:
                if (is_line_end(c)) return fail(Action::kFailEmptyDescription);
                if (c == ' ') return to(State::kSpaces);
                return to(State::kDescription, Action::kMarkToken);

            case State::kDescription:
                if (is_line_end(c)) return to(State::kDescriptionEnd, Action::kEmitDescription);
                return to(State::kDescription);

            case State::kDescriptionEnd:
                if (is_line_end(c)) return to(State::kBlankLine);
                return fail(Action::kFailMissingBlankLine);

            case State::kBlankLine:
                return to(State::kBody, Action::kMarkBody);

            case State::kBody:
                return to(State::kBody);

            case State::kSink:
                break;
        }

        return to(State::kSink);
    }

    bool requires_lookahead(State s, syntax::KeywordNode node, const syntax::KeywordTable& table) {
        switch (s) {
            case State::kBang:
            case State::kScopeClose:
            case State::kColon:
                return true;
            case State::kType:
                return table.is_terminal(node);
            default:
                return false;
        }
    }

    bool is_accepting(State s) {
        return s == State::kDescription || s == State::kBlankLine || s == State::kBody;
    }

} // namespace convco::fsm
