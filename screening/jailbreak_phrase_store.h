#pragma once

#include <string>
#include <vector>

namespace promptgate {

// Known jailbreak strings used when no phrase file is available.
std::vector<std::string> DefaultJailbreakPhrases();

// Loads a JSON array of strings from `path`. A missing file, unparsable JSON
// or a top-level value that is not an array yields DefaultJailbreakPhrases();
// non-string array entries are skipped. Never throws.
std::vector<std::string> LoadJailbreakPhrases(const std::string& path);

}  // namespace promptgate
