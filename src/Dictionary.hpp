#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

// Returns an index in [0, n). Injected wherever a word is drawn at random.
using RandomSource = std::function<size_t(size_t n)>;

RandomSource makeRandomSource(uint64_t seed);

// Immutable set of same-length lowercase words.
class Dictionary {
public:
    // Lowercases, drops words of the wrong length or with letters outside a-z,
    // deduplicates. Throws std::invalid_argument if fewer than two words remain.
    explicit Dictionary(const std::vector<std::string>& words, int wordLength = 4,
                        std::string fallback = "sale");

    bool contains(const std::string& word) const;
    std::string sample(const RandomSource& random) const;

    int wordLength() const { return m_length; }
    size_t size() const { return m_sorted.size(); }
    const std::vector<std::string>& words() const { return m_sorted; } // sorted

    static std::string toLower(std::string s);
    static bool isLowerAlpha(const std::string& s);

private:
    int m_length;
    std::string m_fallback;
    std::vector<std::string> m_sorted;
    std::unordered_set<std::string> m_set;
};
