#pragma once

#include "types.h"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace firmlink {

struct NormalizerOptions {
    // Corporate-form tokens removed from the end of a name
    std::vector<std::string> suffixes;
    // Whole-token abbreviation expansions ("intl" -> "international")
    std::unordered_map<std::string, std::string> abbreviations;
    // Rewrite '&' as the token "and" instead of dropping it
    bool ampersand_as_and = true;

    static NormalizerOptions defaults();
};

class NameNormalizer {
public:
    NameNormalizer();
    explicit NameNormalizer(NormalizerOptions options);

    // Raw name -> comparison key. Total: never throws, empty or blank input
    // gives the empty key. Steps run in a fixed order:
    //   lowercase, strip diacritics, punctuation, collapse whitespace,
    //   expand abbreviations, strip trailing corporate suffixes
    CanonicalKey normalize(const RawName& raw) const;

    bool is_suffix(const std::string& token) const { return suffixes_.count(token) > 0; }
    const NormalizerOptions& options() const { return options_; }

private:
    NormalizerOptions options_;
    std::unordered_set<std::string> suffixes_;

    // Lowercase, diacritics and punctuation; output tokens separated by single or repeated spaces
    std::string fold(const RawName& raw) const;
};

// Normalize with the default options
CanonicalKey normalize(const RawName& raw);

// Split a key into its space-separated tokens
std::vector<std::string> split_tokens(const std::string& key);

} // namespace firmlink
