#include "firmlink/normalizer.h"
#include "firmlink/unicode_utils.h"

#include <unicode/locid.h>

#include <utility>
#include <vector>

namespace firmlink {

namespace {
using firmlink::unicode::from_unicode_string;
using firmlink::unicode::is_alnum;
using firmlink::unicode::is_elided;
using firmlink::unicode::is_hyphen;
using firmlink::unicode::strip_marks;
using firmlink::unicode::to_unicode_string;

// Letters NFD does not decompose into base + mark
const char* fold_letter(UChar32 c) {
    switch (c) {
        case 0x00DF: return "ss";  // ß
        case 0x00E6: return "ae";  // æ
        case 0x00F8: return "o";   // ø
        case 0x0153: return "oe";  // œ
        case 0x0142: return "l";   // ł
        case 0x0111: return "d";   // đ
        case 0x0131: return "i";   // ı
        case 0x00FE: return "th";  // þ
        case 0x00F0: return "d";   // ð
        default: return nullptr;
    }
}

} // namespace

NormalizerOptions NormalizerOptions::defaults() {
    NormalizerOptions options;
    options.suffixes = {
        "inc", "incorporated", "corp", "corporation", "co", "company",
        "ltd", "limited", "llc", "plc", "sa", "ag", "nv", "bv", "gmbh",
        "kk", "spa", "srl", "lp", "llp"
    };
    options.abbreviations = {
        {"intl", "international"},
        {"natl", "national"},
        {"mfg", "manufacturing"},
        {"tech", "technology"},
        {"sys", "systems"},
    };
    return options;
}

NameNormalizer::NameNormalizer() : NameNormalizer(NormalizerOptions::defaults()) {}

NameNormalizer::NameNormalizer(NormalizerOptions options) : options_(std::move(options)) {
    suffixes_.insert(options_.suffixes.begin(), options_.suffixes.end());
}

std::string NameNormalizer::fold(const RawName& raw) const {
    // Lowercase with the root locale, then drop combining marks, then spell
    // out letters NFD leaves alone (ß, æ, ø...).
    icu::UnicodeString ustr = to_unicode_string(raw);
    ustr.toLower(icu::Locale::getRoot());
    ustr = strip_marks(ustr);

    std::vector<UChar32> chars;
    chars.reserve(static_cast<size_t>(ustr.length()));
    for (int32_t i = 0; i < ustr.length();) {
        UChar32 c = ustr.char32At(i);
        i += U16_LENGTH(c);
        if (const char* folded = fold_letter(c)) {
            for (const char* p = folded; *p != '\0'; ++p) {
                chars.push_back(static_cast<UChar32>(*p));
            }
        } else {
            chars.push_back(c);
        }
    }

    icu::UnicodeString out;
    for (size_t i = 0; i < chars.size(); ++i) {
        UChar32 c = chars[i];
        if (is_alnum(c)) {
            out.append(c);
        } else if (is_hyphen(c)) {
            // "Hewlett-Packard" keeps its hyphen, "Acme - Europe" does not
            bool internal = i > 0 && i + 1 < chars.size() && is_alnum(chars[i - 1]) && is_alnum(chars[i + 1]);
            out.append(internal ? UChar32('-') : UChar32(' '));
        } else if (c == '&' && options_.ampersand_as_and) {
            out.append(icu::UnicodeString::fromUTF8(" and "));
        } else if (is_elided(c)) {
            continue;
        } else {
            out.append(UChar32(' '));
        }
    }
    return from_unicode_string(out);
}

CanonicalKey NameNormalizer::normalize(const RawName& raw) const {
    if (raw.empty()) {
        return "";
    }

    std::vector<std::string> tokens = split_tokens(fold(raw));

    for (auto& token : tokens) {
        auto it = options_.abbreviations.find(token);
        if (it != options_.abbreviations.end()) {
            token = it->second;
        }
    }

    // Only trailing suffixes go, and a name is never reduced to nothing
    while (tokens.size() > 1 && is_suffix(tokens.back())) {
        tokens.pop_back();
    }

    std::string key;
    for (const auto& token : tokens) {
        if (!key.empty()) {
            key += ' ';
        }
        key += token;
    }
    return key;
}

CanonicalKey normalize(const RawName& raw) {
    static const NameNormalizer normalizer;
    return normalizer.normalize(raw);
}

std::vector<std::string> split_tokens(const std::string& key) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : key) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

} // namespace firmlink
