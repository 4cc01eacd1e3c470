#include <convco/syntax/KeywordTable.hpp>
#include <convco/syntax/TypeProfile.hpp>

#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using convco::syntax::KeywordNode;
    using convco::syntax::KeywordTable;
    using convco::syntax::TypeProfile;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static const std::vector<std::string> k_minimal = {"feat", "fix"};
    static const std::vector<std::string> k_conventional = {
        "build", "chore", "ci", "docs", "feat", "fix", "perf", "refactor", "revert", "style", "test",
    };
    static const std::vector<std::string> k_falco = {
        "build", "chore", "ci", "docs", "feat", "fix", "new", "perf", "revert", "rule", "test", "update",
    };

    // every word that appears in any profile, plus near misses
    static const std::vector<std::string> k_probe = {
        "build", "chore", "ci", "docs", "feat", "fix", "new", "perf", "refactor", "revert",
        "rule", "style", "test", "update",
        "", "f", "fe", "fea", "feats", "fixup", "c", "chor", "re", "rev", "revers", "ru",
        "tests", "upd", "FEAT", "Fix", "doc", "styles", "perfx", "news",
    };

    static bool check_exact_set_(TypeProfile p, const std::vector<std::string>& expected) {
        const auto& t = convco::syntax::keyword_table(p);
        const std::set<std::string> want(expected.begin(), expected.end());

        bool ok = true;
        for (const auto& w : k_probe) {
            const bool in = want.count(w) != 0;
            if (t.contains(w) != in) {
                std::cerr << "  - profile " << convco::syntax::profile_name(p)
                          << " disagrees on '" << w << "'\n";
                ok = false;
            }
        }
        ok &= require_(t.keywords() == expected, "keywords() must list the profile in sorted order");
        return ok;
    }

    static bool test_minimal_profile_exact_set() {
        return check_exact_set_(TypeProfile::kMinimal, k_minimal);
    }

    static bool test_conventional_profile_exact_set() {
        return check_exact_set_(TypeProfile::kConventional, k_conventional);
    }

    static bool test_falco_profile_exact_set() {
        return check_exact_set_(TypeProfile::kFalco, k_falco);
    }

    static KeywordNode walk_(const KeywordTable& t, std::string_view w) {
        KeywordNode n = t.root();
        for (char c : w) {
            n = t.next(n, static_cast<unsigned char>(c));
            if (n == convco::syntax::k_no_node) break;
        }
        return n;
    }

    static bool test_keywords_share_suffix_states() {
        const auto& t = convco::syntax::keyword_table(TypeProfile::kConventional);

        size_t trie_nodes = 1;
        {
            std::set<std::string> prefixes;
            for (const auto& w : k_conventional) {
                for (size_t i = 1; i <= w.size(); ++i) prefixes.insert(w.substr(0, i));
            }
            trie_nodes += prefixes.size();
        }

        bool ok = true;
        ok &= require_(t.node_count() < trie_nodes, "minimized table must be smaller than the plain trie");

        // "refactor"/"revert" diverge after "re" and reconverge on the final accepting node.
        const KeywordNode end_refactor = walk_(t, "refactor");
        const KeywordNode end_revert = walk_(t, "revert");
        const KeywordNode end_feat = walk_(t, "feat");
        ok &= require_(end_refactor == end_revert, "refactor and revert must end on the same node");
        ok &= require_(end_feat == end_revert, "all keywords must end on one shared accepting node");
        ok &= require_(t.is_terminal(end_feat), "shared end node must be terminal");

        // "fea" + "t" and "tes" + "t" share the 't'-terminal state
        ok &= require_(walk_(t, "fea") == walk_(t, "tes"), "'fea' and 'tes' must reach the same suffix state");
        ok &= require_(walk_(t, "fea") != walk_(t, "fi"), "'fea' and 'fi' expect different suffixes");
        return ok;
    }

    static bool test_first_mismatch_has_no_edge() {
        const auto& t = convco::syntax::keyword_table(TypeProfile::kFalco);

        KeywordNode n = walk_(t, "upd");
        bool ok = true;
        ok &= require_(n != convco::syntax::k_no_node, "'upd' must be a live prefix");
        ok &= require_(!t.is_terminal(n), "'upd' must not be accepting");
        ok &= require_(t.next(n, 'x') == convco::syntax::k_no_node, "'x' must not continue 'upd'");
        ok &= require_(t.next(n, 'a') != convco::syntax::k_no_node, "'a' must continue 'upd'");
        ok &= require_(t.next(t.root(), 'F') == convco::syntax::k_no_node, "uppercase bytes have no edges");
        ok &= require_(t.next(t.root(), 0xE9) == convco::syntax::k_no_node, "non-ASCII bytes have no edges");
        return ok;
    }

    static bool test_prefix_keywords_supported() {
        // not used by any built-in profile, but the builder must handle it
        const KeywordTable t({"fix", "fixup"});

        bool ok = true;
        ok &= require_(t.contains("fix"), "'fix' must be accepted");
        ok &= require_(t.contains("fixup"), "'fixup' must be accepted");
        ok &= require_(!t.contains("fixu"), "'fixu' must be rejected");

        const KeywordNode n = walk_(t, "fix");
        ok &= require_(t.is_terminal(n) && t.next(n, 'u') != convco::syntax::k_no_node,
            "terminal node may keep outgoing edges");
        return ok;
    }

    static bool test_unsorted_input_rejected() {
        bool threw = false;
        try {
            const KeywordTable t({"fix", "feat"});
            (void)t;
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        return require_(threw, "unsorted keyword list must throw std::invalid_argument");
    }

    static bool test_profile_names_round_trip() {
        bool ok = true;
        for (auto p : {TypeProfile::kMinimal, TypeProfile::kConventional, TypeProfile::kFalco}) {
            auto back = convco::syntax::parse_profile(convco::syntax::profile_name(p));
            ok &= require_(back.has_value() && *back == p, "profile name must parse back");
        }
        ok &= require_(!convco::syntax::parse_profile("angular").has_value(), "unknown profile must be rejected");
        ok &= require_(!convco::syntax::parse_profile("Minimal").has_value(), "profile names are case-sensitive");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"minimal_profile_exact_set", test_minimal_profile_exact_set},
        {"conventional_profile_exact_set", test_conventional_profile_exact_set},
        {"falco_profile_exact_set", test_falco_profile_exact_set},
        {"keywords_share_suffix_states", test_keywords_share_suffix_states},
        {"first_mismatch_has_no_edge", test_first_mismatch_has_no_edge},
        {"prefix_keywords_supported", test_prefix_keywords_supported},
        {"unsorted_input_rejected", test_unsorted_input_rejected},
        {"profile_names_round_trip", test_profile_names_round_trip},
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
