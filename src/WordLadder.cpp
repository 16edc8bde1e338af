#include "WordLadder.hpp"
#include <algorithm>
#include <queue>
#include <unordered_map>
#include <unordered_set>

bool WordLadder::differsByOneLetter(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    int diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i] && ++diff > 1) return false;
    }
    return diff == 1;
}

std::vector<std::string> WordLadder::neighbours(const Dictionary& dict, const std::string& word) {
    std::vector<std::string> out;
    std::string cand = word;
    for (size_t i = 0; i < cand.size(); ++i) {
        const char orig = cand[i];
        for (char c = 'a'; c <= 'z'; ++c) {
            if (c == orig) continue;
            cand[i] = c;
            if (dict.contains(cand)) out.push_back(cand);
        }
        cand[i] = orig;
    }
    return out;
}

std::vector<std::string> WordLadder::findPath(const Dictionary& dict, const std::string& start,
                                              const std::string& target) {
    if ((int)start.size() != dict.wordLength() || !dict.contains(target)) return {};
    if (start == target) return { start };

    std::queue<std::string> frontier;
    std::unordered_set<std::string> visited;
    std::unordered_map<std::string, std::string> parent;
    frontier.push(start);
    visited.insert(start);

    while (!frontier.empty()) {
        std::string cur = frontier.front();
        frontier.pop();
        if (cur == target) {
            std::vector<std::string> path;
            for (std::string w = target; ; w = parent[w]) {
                path.push_back(w);
                if (w == start) break;
            }
            std::reverse(path.begin(), path.end());
            return path;
        }
        for (auto& next : neighbours(dict, cur)) {
            if (!visited.insert(next).second) continue;
            parent[next] = cur;
            frontier.push(std::move(next));
        }
    }
    return {};
}
