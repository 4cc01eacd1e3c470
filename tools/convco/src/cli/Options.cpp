// tools/convco/src/cli/Options.cpp
#include <convco_tool/cli/Options.hpp>

#include <convco/syntax/TypeProfile.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convco_tool::cli {

    namespace {

        /// @brief `--lang` 옵션을 파싱한다.
        convco::diag::Language parse_lang(const std::vector<std::string_view>& args) {
            for (size_t i = 0; i + 1 < args.size(); ++i) {
                if (args[i] == "--lang") {
                    if (args[i + 1] == "ko") return convco::diag::Language::kKo;
                    return convco::diag::Language::kEn;
                }
            }
            return convco::diag::Language::kEn;
        }

        /// @brief 특정 키 플래그 위치를 탐색한다.
        std::optional<size_t> find_flag(const std::vector<std::string_view>& args, std::string_view key) {
            for (size_t i = 0; i < args.size(); ++i) {
                if (args[i] == key) return i;
            }
            return std::nullopt;
        }

        /// @brief `--types <profile>` 또는 `--types=<profile>` 을 파싱한다. 값이 잘못되면 opt 에 에러를 남긴다.
        void parse_types(const std::vector<std::string_view>& args, Options& opt) {
            constexpr std::string_view key = "--types=";

            std::optional<std::string_view> value;
            for (size_t i = 0; i < args.size(); ++i) {
                if (args[i] == "--types") {
                    if (i + 1 >= args.size()) {
                        opt.ok = false;
                        opt.error = "--types requires a profile name";
                        return;
                    }
                    value = args[i + 1];
                } else if (args[i].size() > key.size() && args[i].substr(0, key.size()) == key) {
                    value = args[i].substr(key.size());
                }
            }

            if (!value) return;

            if (auto p = convco::syntax::parse_profile(*value)) {
                opt.parse_opt.profile = *p;
                return;
            }
            opt.ok = false;
            opt.error = "unknown --types value '" + std::string(*value) + "' (expected minimal|conventional|falco)";
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "convco\n"
            << "  --version\n"
            << "  --list-types [--types P]\n"
            << "  --message \"<commit message>\" [options]\n"
            << "  --file <path> [options]\n"
            << "  --stdin [options]\n"
            << "\n"
            << "Options:\n"
            << "  --types minimal|conventional|falco   (default: minimal)\n"
            << "  --best-effort       (print the partial message even when parsing fails)\n"
            << "  --lang en|ko\n"
            << "  --verbose           (stream parser events to stderr)\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        for (auto a : args) {
            if (a == "--version") {
                opt.mode = Mode::kVersion;
                return opt;
            }
        }

        opt.lang = parse_lang(args);
        opt.verbose = find_flag(args, "--verbose").has_value();
        opt.parse_opt.best_effort = find_flag(args, "--best-effort").has_value();

        parse_types(args, opt);
        if (!opt.ok) return opt;

        if (find_flag(args, "--list-types")) {
            opt.mode = Mode::kListTypes;
            return opt;
        }

        if (auto i = find_flag(args, "--message")) {
            if (*i + 1 >= args.size()) {
                opt.ok = false;
                opt.error = "--message requires a string";
                return opt;
            }
            opt.mode = Mode::kMessage;
            opt.payload = std::string(args[*i + 1]);
            return opt;
        }

        if (auto i = find_flag(args, "--file")) {
            if (*i + 1 >= args.size()) {
                opt.ok = false;
                opt.error = "--file requires a path";
                return opt;
            }
            opt.mode = Mode::kFile;
            opt.payload = std::string(args[*i + 1]);
            return opt;
        }

        if (find_flag(args, "--stdin")) {
            opt.mode = Mode::kStdin;
            return opt;
        }

        opt.mode = Mode::kUsage;
        return opt;
    }

} // namespace convco_tool::cli
