#pragma once
#include "Dictionary.hpp"
#include <string>
#include <vector>

namespace WordLadder {
    // Same length and exactly one differing position. Identical words are not neighbours.
    bool differsByOneLetter(const std::string& a, const std::string& b);

    // Dictionary words one substitution away from `word`, in position then letter order.
    std::vector<std::string> neighbours(const Dictionary& dict, const std::string& word);

    // Shortest ladder start..target (both included) by BFS over the implicit
    // one-letter graph. Empty when target is unreachable.
    std::vector<std::string> findPath(const Dictionary& dict, const std::string& start,
                                      const std::string& target);
}
