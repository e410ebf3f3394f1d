#pragma once

#include "dictionary.h"

#include <string>

namespace firmlink {

// JSON holding the entity registry, the assertion log and the derived alias
// view. Loading replays the log and throws DictionaryFormatError unless the
// replayed view equals the stored one.
CanonicalDictionary load_dictionary(const std::string& path);
CanonicalDictionary parse_dictionary(const std::string& text);
void save_dictionary(const CanonicalDictionary& dictionary, const std::string& path);
std::string dump_dictionary(const CanonicalDictionary& dictionary);

} // namespace firmlink
