// tools/convco/src/driver/Runner.cpp
#include "Runner.hpp"

#include <convco/diag/Render.hpp>
#include <convco/log/Sink.hpp>
#include <convco/message/Message.hpp>
#include <convco/os/File.hpp>
#include <convco/parse/Parser.hpp>
#include <convco/syntax/KeywordTable.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace convco_tool::driver {

    namespace {

        /// @brief 파싱된 메시지를 필드별로 출력한다.
        void dump_message(const convco::Message& m, std::ostream& os) {
            os << "TYPE: " << m.type << "\n";
            if (m.scope) {
                os << "SCOPE: \"" << *m.scope << "\"\n";
            } else {
                os << "SCOPE: (none)\n";
            }
            os << "BREAKING: " << (m.is_breaking_change() ? "yes" : "no") << "\n";
            os << "DESCRIPTION: " << m.description << "\n";
            if (m.body) {
                os << "BODY:\n" << *m.body << "\n";
            } else {
                os << "BODY: (none)\n";
            }
        }

        /// @brief 현재 profile 이 허용하는 타입 키워드를 한 줄에 하나씩 출력한다.
        int list_types(const cli::Options& opt) {
            const auto& table = convco::syntax::keyword_table(opt.parse_opt.profile);
            std::cout << convco::syntax::profile_name(opt.parse_opt.profile) << ":\n";
            for (const auto& kw : table.keywords()) {
                std::cout << "  " << kw << "\n";
            }
            return 0;
        }

        /// @brief 모드에 따라 메시지 원문을 읽는다. 실패 시 false.
        bool load_source(const cli::Options& opt, std::string& src, std::string& name) {
            std::string err;
            switch (opt.mode) {
                case cli::Mode::kMessage:
                    src = opt.payload;
                    name = "<message>";
                    return true;

                case cli::Mode::kFile:
                    name = opt.payload;
                    if (!convco::open_file(opt.payload, src, err)) {
                        std::cerr << "error: " << opt.payload << ": " << err << "\n";
                        return false;
                    }
                    return true;

                case cli::Mode::kStdin:
                    name = "<stdin>";
                    if (!convco::read_stream(std::cin, src, err)) {
                        std::cerr << "error: <stdin>: " << err << "\n";
                        return false;
                    }
                    return true;

                default:
                    return false;
            }
        }

    } // namespace

    int run(const cli::Options& opt) {
        if (opt.mode == cli::Mode::kListTypes) return list_types(opt);

        std::string src;
        std::string name;
        if (!load_source(opt, src, name)) return 2;

        convco::log::StreamSink sink(std::cerr, opt.lang);
        convco::ParseOptions popt = opt.parse_opt;
        if (opt.verbose) popt.sink = &sink;

        const auto res = convco::parse(src, popt);

        if (res.message) {
            dump_message(*res.message, std::cout);
        }

        if (res.diagnostic) {
            std::cerr << convco::diag::render_one(*res.diagnostic, opt.lang, src, name) << "\n";
            return 1;
        }
        return 0;
    }

} // namespace convco_tool::driver
