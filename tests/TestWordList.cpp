#include <catch2/catch.hpp>

#include "Dictionary.hpp"
#include "Engine.hpp"
#include "WordList.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

namespace {

std::string writeTemp(const std::string& name, const std::string& contents)
{
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    return path.string();
}

} // namespace

TEST_CASE("WordList loads, normalizes and deduplicates a file", "[wordlist]")
{
    auto path = writeTemp("weaver_words_basic.txt",
                          "Sale\r\nPALE\npale\ntoolong\nab1c\n  opal  \n\nxyz\n");

    auto words = WordList::loadFromFile(path, 4);
    REQUIRE(words == std::vector<std::string>{ "sale", "pale", "opal" });

    auto any = WordList::loadFromFile(path, 0);
    REQUIRE(any == std::vector<std::string>{ "sale", "pale", "toolong", "opal", "xyz" });

    std::filesystem::remove(path);
}

TEST_CASE("WordList returns nothing for a missing file", "[wordlist]")
{
    REQUIRE(WordList::loadFromFile("/nonexistent/weaver/words.txt", 4).empty());
}

TEST_CASE("WordList builtin list carries the default pair", "[wordlist]")
{
    auto words = WordList::loadBuiltin(4);
    REQUIRE(words.size() == 190);
    for (const auto& w : words) REQUIRE(w.size() == 4);

    Dictionary dict(words, 4);
    REQUIRE(dict.size() == words.size());
    REQUIRE(dict.contains("sale"));
    REQUIRE(dict.contains("opal"));

    REQUIRE(WordList::loadBuiltin(5).empty());
}

TEST_CASE("WordList load falls back to the builtin list", "[wordlist]")
{
    SECTION("missing file")
    {
        REQUIRE(WordList::load("/nonexistent/weaver/words.txt", 4) == WordList::loadBuiltin(4));
    }
    SECTION("file with a single usable word")
    {
        auto path = writeTemp("weaver_words_single.txt", "sale\nsales\n");
        REQUIRE(WordList::load(path, 4) == WordList::loadBuiltin(4));
        std::filesystem::remove(path);
    }
    SECTION("usable file wins")
    {
        auto path = writeTemp("weaver_words_usable.txt", "sale\npale\nopal\n");
        REQUIRE(WordList::load(path, 4) == std::vector<std::string>{ "sale", "pale", "opal" });
        std::filesystem::remove(path);
    }
}

TEST_CASE("Builtin list drives a playable engine", "[wordlist][engine]")
{
    auto dict = std::make_shared<const Dictionary>(WordList::loadBuiltin(4), 4);
    Engine engine(dict);

    REQUIRE(engine.startWord() == "sale");
    REQUIRE(engine.submitWord("pale"));
    REQUIRE(engine.submitWord("male"));
    REQUIRE(engine.currentAttempt() == 2);
}

TEST_CASE("Builtin list connects the default pair", "[wordlist][engine]")
{
    auto dict = std::make_shared<const Dictionary>(WordList::loadBuiltin(4), 4);
    Engine engine(dict);

    auto path = engine.findPath();
    REQUIRE_FALSE(path.empty());
    REQUIRE(path.front() == "sale");
    REQUIRE(path.back() == "opal");
    REQUIRE(path.size() == 16);

    for (size_t i = 1; i < path.size(); ++i) REQUIRE(engine.submitWord(path[i]));
    REQUIRE(engine.hasWon());
}
