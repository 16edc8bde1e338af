#pragma once
#include "Dictionary.hpp"
#include "Engine.hpp"
#include <memory>
#include <string>
#include <vector>

// Sorted order:
//  0 card  1 cold  2 cord  3 oale  4 opae  5 opal  6 ople  7 pale  8 pane
//  9 pant 10 sale 11 sold 12 sole 13 ward 14 warm 15 word 16 worm 17 xylo
// Only ladder from sale to opal in four steps: sale oale ople opae opal.
inline std::vector<std::string> fixtureWords() {
    return {
        "sale", "pale", "pane", "pant", "opal",
        "oale", "ople", "opae", "sole", "sold",
        "cold", "cord", "card", "ward", "warm",
        "word", "worm", "xylo",
    };
}

inline std::shared_ptr<const Dictionary> fixtureDictionary() {
    return std::make_shared<const Dictionary>(fixtureWords(), 4);
}

// Replays `picks` in order, then repeats the last one.
inline RandomSource scriptedSource(std::vector<size_t> picks, std::shared_ptr<int> calls = nullptr) {
    auto pos = std::make_shared<size_t>(0);
    return [picks, pos, calls](size_t n) -> size_t {
        if (calls) ++*calls;
        size_t i = *pos < picks.size() ? picks[(*pos)++] : picks.back();
        return i % n;
    };
}

inline bool oneLetterApart(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    int d = 0;
    for (size_t i = 0; i < a.size(); ++i) if (a[i] != b[i]) ++d;
    return d == 1;
}
