#include <convco/diag/Diagnostic.hpp>
#include <convco/diag/Render.hpp>
#include <convco/log/Sink.hpp>
#include <convco/parse/Parser.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

    using convco::diag::Code;
    using convco::diag::Diagnostic;
    using convco::diag::Language;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool expect_eq_(const std::string& got, const std::string& want) {
        if (got == want) return true;
        std::cerr << "  - want:\n" << want << "\n  - got:\n" << got << "\n";
        return false;
    }

    static bool test_column_is_zero_padded_to_two_digits() {
        Diagnostic a(Code::kEmptyInput, 0);
        Diagnostic b(Code::kIllegalNewline, 7);
        Diagnostic c(Code::kIllegalNewline, 123);

        bool ok = true;
        ok &= expect_eq_(a.message(), "empty input: col=00");
        ok &= expect_eq_(b.message(), "illegal newline: col=07");
        ok &= expect_eq_(c.message(), "illegal newline: col=123");
        return ok;
    }

    static bool test_args_fill_templates() {
        Diagnostic d(Code::kMissingColon, 5);
        d.add_arg("x");

        bool ok = true;
        ok &= expect_eq_(d.message(), "expecting colon (':') character, got 'x' character: col=05");
        ok &= expect_eq_(convco::diag::render_message(d, Language::kEn), d.message());
        return ok;
    }

    static bool test_korean_catalog() {
        Diagnostic e(Code::kEmptyInput, 0);
        Diagnostic d(Code::kEarlyExit, 4);
        d.add_arg("!");

        bool ok = true;
        ok &= expect_eq_(convco::diag::render_message(e, Language::kKo), "입력이 비어 있습니다: col=00");
        ok &= expect_eq_(convco::diag::render_message(d, Language::kKo),
            "'!' 문자 뒤에서 입력이 너무 일찍 끝났습니다: col=04");
        return ok;
    }

    static bool test_char_arg_latin1() {
        bool ok = true;
        ok &= require_(convco::diag::char_arg('x') == "x", "ASCII bytes print as themselves");
        ok &= require_(convco::diag::char_arg(0xE9) == "\xC3\xA9", "0xE9 must print as U+00E9");
        ok &= require_(convco::diag::char_arg(0x80) == "\xC2\x80", "0x80 must print as U+0080");
        ok &= require_(convco::diag::char_arg(0xFF) == "\xC3\xBF", "0xFF must print as U+00FF");
        return ok;
    }

    static bool test_code_names_are_stable() {
        bool ok = true;
        ok &= require_(std::string(convco::diag::code_name(Code::kMissingColon)) == "MissingColon", "MissingColon");
        ok &= require_(std::string(convco::diag::code_name(Code::kMissingBlankLineAtBodyBegin)) ==
            "MissingBlankLineAtBodyBegin", "MissingBlankLineAtBodyBegin");
        ok &= require_(std::string(convco::diag::code_name(Code::kEarlyExit)) == "EarlyExit", "EarlyExit");
        return ok;
    }

    static bool test_snippet_points_at_offending_byte() {
        const std::string src = "feat(a(b)): x";
        const auto r = convco::parse(src);
        if (!require_(r.diagnostic.has_value(), "nested scope must fail")) return false;

        return expect_eq_(
            convco::diag::render_one(*r.diagnostic, Language::kEn, src),
            "error[MalformedScope]: illegal '(' character in scope: col=06\n"
            " --> <message>:1:7\n"
            "  |\n"
            "1 | feat(a(b)): x\n"
            "  |       ^");
    }

    static bool test_snippet_on_second_line() {
        const std::string src = "feat: x\nbody";
        const auto r = convco::parse(src);
        if (!require_(r.diagnostic.has_value(), "missing blank line must fail")) return false;

        return expect_eq_(
            convco::diag::render_one(*r.diagnostic, Language::kEn, src, "COMMIT_EDITMSG"),
            "error[MissingBlankLineAtBodyBegin]: body must begin with a blank line: col=08\n"
            " --> COMMIT_EDITMSG:2:1\n"
            "  |\n"
            "2 | body\n"
            "  | ^");
    }

    static bool test_illegal_newline_points_at_lf() {
        const std::string src = "feat: \n";
        const auto r = convco::parse(src);
        if (!require_(r.diagnostic.has_value(), "empty description must fail")) return false;

        return expect_eq_(
            convco::diag::render_one(*r.diagnostic, Language::kEn, src),
            "error[IllegalNewline]: illegal newline: col=07\n"
            " --> <message>:1:7\n"
            "  |\n"
            "1 | feat: \n"
            "  |       ^");
    }

    static bool test_snippet_at_end_of_input() {
        const std::string src = "feat";
        const auto r = convco::parse(src);
        if (!require_(r.diagnostic.has_value(), "truncated type must fail")) return false;

        return expect_eq_(
            convco::diag::render_one(*r.diagnostic, Language::kEn, src),
            "error[EarlyExit]: early exit after 't' character: col=03\n"
            " --> <message>:1:4\n"
            "  |\n"
            "1 | feat\n"
            "  |    ^");
    }

    static bool test_stream_sink_lines() {
        std::ostringstream en;
        std::ostringstream ko;
        convco::log::StreamSink en_sink(en);
        convco::log::StreamSink ko_sink(ko, Language::kKo);

        convco::ParseOptions opt{};
        opt.sink = &en_sink;
        (void)convco::parse("feat(io): x", opt);
        opt.sink = &ko_sink;
        (void)convco::parse("", opt);

        bool ok = true;
        ok &= expect_eq_(en.str(),
            "info: valid commit message type type=feat\n"
            "info: valid commit message scope scope=io\n"
            "info: valid commit message description description=x\n");
        ok &= expect_eq_(ko.str(), "error[EmptyInput]: 입력이 비어 있습니다: col=00\n");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"column_is_zero_padded_to_two_digits", test_column_is_zero_padded_to_two_digits},
        {"args_fill_templates", test_args_fill_templates},
        {"korean_catalog", test_korean_catalog},
        {"char_arg_latin1", test_char_arg_latin1},
        {"code_names_are_stable", test_code_names_are_stable},
        {"snippet_points_at_offending_byte", test_snippet_points_at_offending_byte},
        {"snippet_on_second_line", test_snippet_on_second_line},
        {"illegal_newline_points_at_lf", test_illegal_newline_points_at_lf},
        {"snippet_at_end_of_input", test_snippet_at_end_of_input},
        {"stream_sink_lines", test_stream_sink_lines},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.def();
        if (!ok) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }

    std::cout << "ALL TESTS PASSED\n";
    return 0;
}
