#include "firmlink/scorer.h"
#include "firmlink/normalizer.h"

namespace firmlink {

namespace {

std::set<std::string> distinct_tokens(const CanonicalKey& key) {
    std::vector<std::string> tokens = split_tokens(key);
    return std::set<std::string>(tokens.begin(), tokens.end());
}

std::size_t shared_chars(const std::set<std::string>& left, const CanonicalKey& right) {
    std::size_t total = 0;
    for (const auto& token : distinct_tokens(right)) {
        if (left.count(token) > 0) {
            total += token.size();
        }
    }
    return total;
}

} // namespace

double token_set_similarity(const CanonicalKey& a, const CanonicalKey& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    return rapidfuzz::fuzz::token_set_ratio(a, b);
}

std::size_t shared_token_chars(const CanonicalKey& a, const CanonicalKey& b) {
    return shared_chars(distinct_tokens(a), b);
}

KeyScorer::KeyScorer(const CanonicalKey& key)
    : key_(key), tokens_(distinct_tokens(key)), cached_(key) {}

double KeyScorer::score(const CanonicalKey& target, double cutoff) const {
    if (key_.empty() || target.empty()) {
        return 0.0;
    }
    return cached_.similarity(target, cutoff);
}

std::size_t KeyScorer::overlap(const CanonicalKey& target) const {
    return shared_chars(tokens_, target);
}

} // namespace firmlink
