// core/src/syntax/keyword_table.cpp
#include <convco/syntax/KeywordTable.hpp>

#include <map>
#include <stdexcept>
#include <utility>


namespace convco::syntax {

    namespace {

        using Node = KeywordTable::Node;
        using Signature = std::pair<bool, std::array<KeywordNode, 26>>;

        bool is_keyword_byte(unsigned char c) {
            return c >= 'a' && c <= 'z';
        }

        /// @brief 정렬된 입력에 대한 점진적 DAFSA 구성 (replace-or-register).
        class DafsaBuilder {
        public:
            DafsaBuilder() {  nodes_.emplace_back();  }

            void insert(std::string_view word) {
                if (word.empty()) {
                    throw std::invalid_argument("keyword table: empty keyword");
                }
                if (!previous_.empty() && word <= previous_) {
                    throw std::invalid_argument("keyword table: keywords must be sorted and unique");
                }

                size_t common = 0;
                while (common < word.size() && common < previous_.size() && word[common] == previous_[common]) {
                    ++common;
                }

                minimize_(common);

                KeywordNode node = unchecked_.empty() ? 0 : unchecked_.back().child;
                for (size_t i = common; i < word.size(); ++i) {
                    const unsigned char c = static_cast<unsigned char>(word[i]);
                    if (!is_keyword_byte(c)) {
                        throw std::invalid_argument("keyword table: keywords must be lowercase ASCII");
                    }

                    const KeywordNode child = add_node_();
                    nodes_[node].edges[c - 'a'] = child;
                    unchecked_.push_back(Pending{node, static_cast<uint8_t>(c - 'a'), child});
                    node = child;
                }
                nodes_[node].terminal = true;

                previous_.assign(word.data(), word.size());
            }

            std::vector<Node> finish() {
                minimize_(0);
                return compact_();
            }

        private:
            struct Pending {
                KeywordNode parent;
                uint8_t letter;
                KeywordNode child;
            };

            KeywordNode add_node_() {
                if (nodes_.size() >= k_no_node) {
                    throw std::length_error("keyword table: too many nodes");
                }
                nodes_.emplace_back();
                return static_cast<KeywordNode>(nodes_.size() - 1);
            }

            // Children of every pending node are already registered, so an
            // equivalent signature means an equivalent right language.
            void minimize_(size_t down_to) {
                while (unchecked_.size() > down_to) {
                    const Pending p = unchecked_.back();
                    unchecked_.pop_back();

                    const Signature sig{nodes_[p.child].terminal, nodes_[p.child].edges};
                    auto it = register_.find(sig);
                    if (it != register_.end()) {
                        nodes_[p.parent].edges[p.letter] = it->second;
                    } else {
                        register_.emplace(sig, p.child);
                    }
                }
            }

            // Drop nodes orphaned by minimization and renumber breadth-first (root stays 0).
            std::vector<Node> compact_() const {
                std::vector<KeywordNode> remap(nodes_.size(), k_no_node);
                std::vector<KeywordNode> order;
                order.reserve(nodes_.size());

                remap[0] = 0;
                order.push_back(0);
                for (size_t i = 0; i < order.size(); ++i) {
                    for (KeywordNode child : nodes_[order[i]].edges) {
                        if (child == 0 || remap[child] != k_no_node) continue;
                        remap[child] = static_cast<KeywordNode>(order.size());
                        order.push_back(child);
                    }
                }

                std::vector<Node> out(order.size());
                for (size_t i = 0; i < order.size(); ++i) {
                    const Node& src = nodes_[order[i]];
                    out[i].terminal = src.terminal;
                    for (size_t e = 0; e < src.edges.size(); ++e) {
                        out[i].edges[e] = (src.edges[e] == 0) ? 0 : remap[src.edges[e]];
                    }
                }
                return out;
            }

            std::vector<Node> nodes_;
            std::vector<Pending> unchecked_;
            std::map<Signature, KeywordNode> register_;
            std::string previous_;
        };

    } // namespace

    KeywordTable::KeywordTable(const std::vector<std::string_view>& sorted_words) {
        DafsaBuilder b;
        for (auto w : sorted_words) {
            b.insert(w);
            keywords_.emplace_back(w);
        }
        nodes_ = b.finish();
    }

    KeywordNode KeywordTable::next(KeywordNode node, unsigned char byte) const {
        if (node >= nodes_.size() || !is_keyword_byte(byte)) return k_no_node;
        const KeywordNode child = nodes_[node].edges[byte - 'a'];
        return (child == 0) ? k_no_node : child;
    }

    bool KeywordTable::contains(std::string_view word) const {
        KeywordNode node = root();
        for (char c : word) {
            node = next(node, static_cast<unsigned char>(c));
            if (node == k_no_node) return false;
        }
        return is_terminal(node);
    }

    const KeywordTable& keyword_table(TypeProfile profile) {
        switch (profile) {
            case TypeProfile::kConventional: {
                static const KeywordTable t({
                    "build", "chore", "ci", "docs", "feat", "fix",
                    "perf", "refactor", "revert", "style", "test",
                });
                return t;
            }
            case TypeProfile::kFalco: {
                static const KeywordTable t({
                    "build", "chore", "ci", "docs", "feat", "fix",
                    "new", "perf", "revert", "rule", "test", "update",
                });
                return t;
            }
            case TypeProfile::kMinimal:
                break;
        }

        static const KeywordTable minimal({"feat", "fix"});
        return minimal;
    }

    std::string_view profile_name(TypeProfile p) {
        switch (p) {
            case TypeProfile::kMinimal: return "minimal";
            case TypeProfile::kConventional: return "conventional";
            case TypeProfile::kFalco: return "falco";
        }
        return "minimal";
    }

    std::optional<TypeProfile> parse_profile(std::string_view s) {
        if (s == "minimal") return TypeProfile::kMinimal;
        if (s == "conventional") return TypeProfile::kConventional;
        if (s == "falco") return TypeProfile::kFalco;
        return std::nullopt;
    }

} // namespace convco::syntax
