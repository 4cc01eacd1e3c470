// core/src/diag/render.cpp
#include <convco/diag/Render.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>


namespace convco::diag {

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    const char* code_name(Code c) {
        switch (c) {
            case Code::kIllegalTypeChar: return "IllegalTypeChar";
            case Code::kIncompleteType: return "IncompleteType";
            case Code::kMissingColon: return "MissingColon";
            case Code::kMalformedScope: return "MalformedScope";
            case Code::kEmptyInput: return "EmptyInput";
            case Code::kEarlyExit: return "EarlyExit";
            case Code::kMissingDescriptionInitialSpace: return "MissingDescriptionInitialSpace";
            case Code::kMissingDescription: return "MissingDescription";
            case Code::kIllegalNewline: return "IllegalNewline";
            case Code::kMissingBlankLineAtBodyBegin: return "MissingBlankLineAtBodyBegin";
        }

        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            // args: {0}=offending or previous character
            case Code::kIllegalTypeChar: return "illegal '{0}' character in commit message type";
            case Code::kIncompleteType: return "incomplete commit message type after '{0}' character";
            case Code::kMissingColon: return "expecting colon (':') character, got '{0}' character";
            case Code::kMalformedScope: return "illegal '{0}' character in scope";
            case Code::kEmptyInput: return "empty input";
            case Code::kEarlyExit: return "early exit after '{0}' character";
            case Code::kMissingDescriptionInitialSpace:
                return "expecting at least one white-space (' ') character, got '{0}' character";
            case Code::kMissingDescription: return "expecting a description text (without newlines) after '{0}' character";
            case Code::kIllegalNewline: return "illegal newline";
            case Code::kMissingBlankLineAtBodyBegin: return "body must begin with a blank line";
        }

        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kIllegalTypeChar: return "커밋 메시지 타입에 허용되지 않는 '{0}' 문자가 있습니다";
            case Code::kIncompleteType: return "'{0}' 문자 뒤에서 커밋 메시지 타입이 끝나지 않았습니다";
            case Code::kMissingColon: return "콜론(':') 문자가 필요하지만 '{0}' 문자가 왔습니다";
            case Code::kMalformedScope: return "스코프에 허용되지 않는 '{0}' 문자가 있습니다";
            case Code::kEmptyInput: return "입력이 비어 있습니다";
            case Code::kEarlyExit: return "'{0}' 문자 뒤에서 입력이 너무 일찍 끝났습니다";
            case Code::kMissingDescriptionInitialSpace:
                return "공백(' ') 문자가 최소 하나 필요하지만 '{0}' 문자가 왔습니다";
            case Code::kMissingDescription: return "'{0}' 문자 뒤에 (개행 없는) 설명 텍스트가 필요합니다";
            case Code::kIllegalNewline: return "허용되지 않는 개행입니다";
            case Code::kMissingBlankLineAtBodyBegin: return "본문은 빈 줄로 시작해야 합니다";
        }

        return "알 수 없는 진단";
    }

    static std::string column_suffix(uint32_t column) {
        std::ostringstream oss;
        oss << ": col=" << std::setw(2) << std::setfill('0') << column;
        return oss.str();
    }

    std::string char_arg(unsigned char b) {
        std::string s;
        if (b < 0x80) {
            s.push_back(static_cast<char>(b));
            return s;
        }

        // U+0080..U+00FF -> 2-byte UTF-8
        s.push_back(static_cast<char>(0xC0 | (b >> 6)));
        s.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        return s;
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        msg = format_template(std::move(msg), d.args());
        return msg + column_suffix(d.column());
    }

    std::string Diagnostic::message() const {
        return render_message(*this, Language::kEn);
    }

    std::string render_one(
        const Diagnostic& d,
        Language lang,
        std::string_view source,
        std::string_view source_name
    ) {
        // IllegalNewline reports the offset after the LF; point at the LF itself.
        size_t anchor = d.column();
        if (d.code() == Code::kIllegalNewline && anchor > 0) --anchor;
        anchor = std::min(anchor, source.size());

        size_t line_begin = 0;
        uint32_t line_no = 1;
        for (size_t i = 0; i < anchor; ++i) {
            if (source[i] == '\n') {
                line_begin = i + 1;
                ++line_no;
            }
        }

        size_t line_end = line_begin;
        while (line_end < source.size() && source[line_end] != '\n' && source[line_end] != '\r') ++line_end;

        const std::string_view line_text = source.substr(line_begin, line_end - line_begin);
        const size_t caret_cols_before = anchor - line_begin;
        const std::string num = std::to_string(line_no);

        std::ostringstream oss;
        oss << "error[" << code_name(d.code()) << "]: " << render_message(d, lang) << "\n";
        oss << " --> " << source_name << ":" << line_no << ":" << (caret_cols_before + 1) << "\n";
        oss << std::string(num.size() + 1, ' ') << "|\n";
        oss << num << " | " << line_text << "\n";
        oss << std::string(num.size() + 1, ' ') << "| ";

        // spaces to caret
        oss << std::string(caret_cols_before, ' ') << '^';

        return oss.str();
    }

} // namespace convco::diag
