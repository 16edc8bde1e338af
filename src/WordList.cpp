#include "WordList.hpp"
#include "Log.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {
    const char* kTag = "wordlist";

    std::string toLower(std::string s) {
        for (auto& c : s) c = (char)std::tolower((unsigned char)c);
        return s;
    }
    bool isAlpha(const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isalpha(c); });
    }
    std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace((unsigned char)s[b])) ++b;
        while (e > b && std::isspace((unsigned char)s[e-1])) --e;
        return s.substr(b, e - b);
    }
}

std::vector<std::string> WordList::loadFromFile(const std::string& path, int fixedLen) {
    std::vector<std::string> out;
    std::ifstream in(path);
    if (!in) {
        Log::warn(kTag, "cannot open " + path);
        return out;
    }
    std::unordered_set<std::string> seen;
    std::string line;
    out.reserve(10000);
    while (std::getline(in, line)) {
        auto w = toLower(trim(line));
        if (w.empty() || !isAlpha(w)) continue;
        if (fixedLen > 0 && (int)w.size() != fixedLen) continue;
        if (seen.insert(w).second) out.push_back(w);
    }
    Log::info(kTag, "loaded " + std::to_string(out.size()) + " words from " + path);
    return out;
}

static const char* builtin4[] = {
    "sale","pale","pane","pant","opal","oral","oval","male","mole","mile",
    "mild","wild","wile","wide","wade","made","mane","many","tale","tall",
    "tell","bell","belt","bolt","bold","cold","cord","card","ward","warm",
    "worm","word","wore","core","care","cane","cone","bone","bond","band",
    "bank","back","pack","pick","sick","sock","rock","rack","race","rice",
    "ride","hide","hike","like","lake","bake","cake","came","come","home",
    "hole","pole","pile","pine","line","lane","late","gate","hate","have",
    "hive","five","fire","hire","here","hero","herd","hard","harm","farm",
    "form","fort","port","part","past","pass","mass","mast","most","must",
    "mist","list","lost","cost","coat","boat","beat","heat","head","lead",
    "load","road","roam","foam","fear","gear","hear","near","neat","seat",
    "sent","tent","test","best","rest","nest","west","went","want","wand",
    "sand","said","sail","tail","toll","doll","will","fill","fell","feel",
    "heel","peel","peal","seal","sell","salt","halt","hall","hail","mail",
    "main","rain","gain","pain","paid","pail","pals","pats","pots","dots",
    "dogs","logs","legs","lens","tens","tons","tone","zone","gone","game",
    "name","same","sane","sang","song","long","lung","hung","hunt","hurt",
    "curt","cart","dart","dare","date","data","dame","fame","face","fact",
    "does","dyes","eyes","eves","even","oven","open","opes","opas","opah",
};

std::vector<std::string> WordList::loadBuiltin(int fixedLen) {
    std::vector<std::string> out;
    if (fixedLen != 4) {
        Log::warn(kTag, "no builtin list for length " + std::to_string(fixedLen));
        return out;
    }
    std::unordered_set<std::string> seen;
    for (const char* w : builtin4) {
        if (seen.insert(w).second) out.push_back(w);
    }
    return out;
}

std::vector<std::string> WordList::load(const std::string& path, int fixedLen) {
    auto words = loadFromFile(path, fixedLen);
    if (words.size() < 2) {
        Log::warn(kTag, "using builtin word list");
        words = loadBuiltin(fixedLen);
    }
    return words;
}
