// core/src/parse/parser.cpp
#include <convco/parse/Parser.hpp>
#include <convco/diag/Render.hpp>
#include <convco/fsm/Automaton.hpp>
#include <convco/syntax/KeywordTable.hpp>

#include <cstdint>
#include <utility>


namespace convco {

    namespace {

        /// @brief 진단 기록 정책.
        /// kAlways: 더 구체적인 메시지를 만들 수 있는 위치 (실제 문제 바이트가 존재함).
        /// kIfUnset: 다음 바이트 존재를 확신할 수 없는 위치. truncation advisory 를 덮어쓰지 않는다.
        enum class Write : uint8_t {
            kAlways,
            kIfUnset,
        };

        /// @brief parse 한 번을 위한 스캔 상태. 재사용하지 않는다.
        class Machine {
        public:
            Machine(std::string_view input, const ParseOptions& opt)
                : data_(input),
                  end_(input.size()),
                  opt_(opt),
                  table_(syntax::keyword_table(opt.profile)) {}

            ParseResult run() {
                if (pos_ == end_) {
                    on_eof_();
                    return finish_();
                }

                while (true) {
                    const fsm::Step st = fsm::step(state_, node_, table_, at_(pos_));

                    apply_leave_(st.leave);
                    apply_(st.action);

                    state_ = st.next;
                    node_ = st.node;
                    if (state_ == fsm::State::kSink) return finish_();

                    // Report the truncation before the missing byte is looked up.
                    if (pos_ + 1 == end_ && fsm::requires_lookahead(state_, node_, table_)) {
                        report_on_current_(diag::Code::kEarlyExit, Write::kAlways);
                    }

                    if (++pos_ == end_) {
                        on_eof_();
                        return finish_();
                    }
                }
            }

        private:
            unsigned char at_(size_t i) const {  return static_cast<unsigned char>(data_[i]);  }

            std::string_view text_() const {
                return data_.substr(token_start_, pos_ - token_start_);
            }

            uint32_t column_(size_t off) const {  return static_cast<uint32_t>(off);  }

            void info_(std::string_view event, std::string_view key = {}, std::string_view value = {}) {
                if (opt_.sink != nullptr) opt_.sink->info(event, key, value);
            }

            void report_(diag::Diagnostic d, Write w) {
                if (w == Write::kIfUnset && diag_.has_value()) return;

                if (opt_.sink != nullptr) opt_.sink->error(d);
                diag_ = std::move(d);
            }

            void report_on_current_(diag::Code code, Write w) {
                // Only a defensive writer can get here at end of input, and only when
                // an advisory is already set; fall back to the last byte regardless.
                const size_t at = (pos_ < end_) ? pos_ : pos_ - 1;

                diag::Diagnostic d(code, column_(pos_));
                d.add_arg(diag::char_arg(at_(at)));
                report_(std::move(d), w);
            }

            void report_on_previous_(diag::Code code, Write w) {
                diag::Diagnostic d(code, column_(pos_));
                if (pos_ > 0) d.add_arg(diag::char_arg(at_(pos_ - 1)));
                report_(std::move(d), w);
            }

            void report_without_char_(diag::Code code, uint32_t column, Write w) {
                report_(diag::Diagnostic(code, column), w);
            }

            void apply_leave_(fsm::LeaveAction a) {
                if (a != fsm::LeaveAction::kEmitType) return;

                out_.set_type(text_());
                info_("valid commit message type", "type", text_());
            }

            void emit_scope_() {
                out_.set_scope(text_());
                info_("valid commit message scope", "scope", text_());
            }

            void apply_(fsm::Action a) {
                using A = fsm::Action;
                switch (a) {
                    case A::kNone:
                        return;

                    case A::kMarkToken:
                    case A::kMarkBody:
                        token_start_ = pos_;
                        return;

                    case A::kSetBreaking:
                        out_.set_breaking();
                        info_("commit message communicates a breaking change");
                        return;

                    case A::kEmitEmptyScope:
                        token_start_ = pos_;
                        emit_scope_();
                        return;

                    case A::kEmitScope:
                        emit_scope_();
                        return;

                    case A::kEmitDescription:
                        out_.set_description(text_());
                        info_("valid commit message description", "description", text_());
                        return;

                    case A::kFailIllegalTypeChar:
                        report_on_current_(diag::Code::kIllegalTypeChar, Write::kAlways);
                        return;

                    case A::kFailMissingColon:
                        report_on_current_(diag::Code::kMissingColon, Write::kIfUnset);
                        return;

                    case A::kFailMalformedScope:
                        report_on_current_(diag::Code::kMalformedScope, Write::kAlways);
                        return;

                    case A::kFailMissingDescriptionInitialSpace:
                        report_on_current_(diag::Code::kMissingDescriptionInitialSpace, Write::kIfUnset);
                        return;

                    case A::kFailEmptyDescription:
                        fail_empty_description_();
                        return;

                    case A::kFailMissingBlankLine:
                        report_without_char_(diag::Code::kMissingBlankLineAtBodyBegin, column_(pos_), Write::kAlways);
                        return;
                }
            }

            void fail_empty_description_() {
                if (pos_ < end_ && at_(pos_) == '\n') {
                    report_without_char_(diag::Code::kIllegalNewline, column_(pos_ + 1), Write::kAlways);
                    return;
                }
                report_on_previous_(diag::Code::kMissingDescription, Write::kAlways);
            }

            /// @brief 입력이 state_ 에서 끝났을 때의 처리 (pos_ == end_).
            void on_eof_() {
                using S = fsm::State;
                switch (state_) {
                    case S::kStart:
                        report_without_char_(diag::Code::kEmptyInput, column_(pos_), Write::kAlways);
                        return;

                    case S::kType:
                        if (table_.is_terminal(node_)) {
                            report_on_current_(diag::Code::kMissingColon, Write::kIfUnset);
                        } else {
                            report_on_previous_(diag::Code::kIncompleteType, Write::kAlways);
                        }
                        return;

                    case S::kBang:
                    case S::kScopeClose:
                        report_on_current_(diag::Code::kMissingColon, Write::kIfUnset);
                        return;

                    case S::kScopeOpen:
                    case S::kScopeText:
                        report_on_previous_(diag::Code::kEarlyExit, Write::kAlways);
                        return;

                    case S::kColon:
                        report_on_current_(diag::Code::kMissingDescriptionInitialSpace, Write::kIfUnset);
                        return;

                    case S::kSpaces:
                        fail_empty_description_();
                        return;

                    case S::kDescription:
                        out_.set_description(text_());
                        info_("valid commit message description", "description", text_());
                        return;

                    case S::kDescriptionEnd:
                        report_without_char_(diag::Code::kMissingBlankLineAtBodyBegin, column_(pos_), Write::kAlways);
                        return;

                    case S::kBlankLine:
                        token_start_ = pos_;
                        [[fallthrough]];
                    case S::kBody:
                        out_.set_body(text_());
                        info_("valid commit message body", "body", text_());
                        return;

                    case S::kSink:
                        return;
                }
            }

            ParseResult finish_() const {
                ParseResult r{};
                if (fsm::is_accepting(state_) && !diag_.has_value()) {
                    r.message = out_.export_message();
                    return r;
                }

                r.diagnostic = diag_;
                if (opt_.best_effort && out_.minimal()) {
                    // partial result: the grammar failed but type and description were matched
                    r.message = out_.export_message();
                }
                return r;
            }

            std::string_view data_;
            size_t pos_ = 0;
            size_t end_ = 0;
            size_t token_start_ = 0;

            fsm::State state_ = fsm::State::kStart;
            syntax::KeywordNode node_ = syntax::k_no_node;

            std::optional<diag::Diagnostic> diag_{};

            const ParseOptions& opt_;
            const syntax::KeywordTable& table_;
            MessageBuilder out_{};
        };

    } // namespace

    ParseResult parse(std::string_view input, const ParseOptions& opt) {
        Machine m(input, opt);
        return m.run();
    }

} // namespace convco
