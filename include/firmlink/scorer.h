#pragma once

#include "types.h"

#include <rapidfuzz/fuzz.hpp>

#include <cstddef>
#include <set>
#include <string>

namespace firmlink {

// Token-set similarity (0-100) between two keys.
double token_set_similarity(const CanonicalKey& a, const CanonicalKey& b);

// Total characters of the distinct tokens both keys share.
std::size_t shared_token_chars(const CanonicalKey& a, const CanonicalKey& b);

// Scores one source key against many target keys; the source side is
// preprocessed once.
class KeyScorer {
public:
    explicit KeyScorer(const CanonicalKey& key);

    // Returns 0 when the similarity is below cutoff
    double score(const CanonicalKey& target, double cutoff = 0.0) const;
    std::size_t overlap(const CanonicalKey& target) const;

    const CanonicalKey& key() const { return key_; }

private:
    CanonicalKey key_;
    std::set<std::string> tokens_;
    rapidfuzz::fuzz::CachedTokenSetRatio<char> cached_;
};

} // namespace firmlink
