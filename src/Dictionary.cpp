#include "Dictionary.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <random>
#include <stdexcept>

RandomSource makeRandomSource(uint64_t seed) {
    auto rng = std::make_shared<std::mt19937_64>(seed);
    return [rng](size_t n) -> size_t {
        if (n == 0) return 0;
        std::uniform_int_distribution<size_t> d(0, n - 1);
        return d(*rng);
    };
}

std::string Dictionary::toLower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool Dictionary::isLowerAlpha(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c){ return c >= 'a' && c <= 'z'; });
}

Dictionary::Dictionary(const std::vector<std::string>& words, int wordLength, std::string fallback)
    : m_length(wordLength), m_fallback(std::move(fallback)) {
    if (m_length <= 0) throw std::invalid_argument("word length must be positive");
    for (const auto& raw : words) {
        auto w = toLower(raw);
        if ((int)w.size() != m_length || !isLowerAlpha(w)) continue;
        if (m_set.insert(w).second) m_sorted.push_back(w);
    }
    if (m_sorted.size() < 2) {
        throw std::invalid_argument("dictionary needs at least two words of length "
                                    + std::to_string(m_length));
    }
    std::sort(m_sorted.begin(), m_sorted.end());
}

bool Dictionary::contains(const std::string& word) const {
    if ((int)word.size() != m_length) return false;
    return m_set.count(toLower(word)) > 0;
}

std::string Dictionary::sample(const RandomSource& random) const {
    if (m_sorted.empty()) return m_fallback;
    size_t i = random(m_sorted.size());
    if (i >= m_sorted.size()) i %= m_sorted.size();
    return m_sorted[i];
}
