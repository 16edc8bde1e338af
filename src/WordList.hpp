#pragma once
#include <string>
#include <vector>

namespace WordList {
    // Load from file: one word per line, lowercased, letters only, filtered to
    // fixedLen when > 0, duplicates dropped (first occurrence kept).
    // Empty result when the file cannot be read.
    std::vector<std::string> loadFromFile(const std::string& path, int fixedLen);

    // Builtin fallback list (4-letter words)
    std::vector<std::string> loadBuiltin(int fixedLen);

    // loadFromFile, falling back to loadBuiltin when fewer than two words come back
    std::vector<std::string> load(const std::string& path, int fixedLen);
}
