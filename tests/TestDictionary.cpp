#include <catch2/catch.hpp>

#include "Dictionary.hpp"
#include "Fixtures.hpp"

#include <set>
#include <stdexcept>

TEST_CASE("Dictionary normalizes and filters its input", "[dictionary]")
{
    Dictionary dict({ "SALE", "pale", "Pale", "toolong", "ab1c", "abc", "opal" }, 4);

    REQUIRE(dict.size() == 3);
    REQUIRE(dict.wordLength() == 4);
    REQUIRE(dict.words() == std::vector<std::string>{ "opal", "pale", "sale" });
}

TEST_CASE("Dictionary membership is case-insensitive and length-checked", "[dictionary]")
{
    auto dict = fixtureDictionary();

    REQUIRE(dict->contains("sale"));
    REQUIRE(dict->contains("SALE"));
    REQUIRE(dict->contains("oPaL"));
    REQUIRE_FALSE(dict->contains("zzzz"));
    REQUIRE_FALSE(dict->contains("sal"));
    REQUIRE_FALSE(dict->contains("sales"));
    REQUIRE_FALSE(dict->contains(""));
}

TEST_CASE("Dictionary rejects degenerate word lists", "[dictionary]")
{
    REQUIRE_THROWS_AS(Dictionary({}, 4), std::invalid_argument);
    REQUIRE_THROWS_AS(Dictionary({ "sale" }, 4), std::invalid_argument);
    REQUIRE_THROWS_AS(Dictionary({ "sale", "SALE" }, 4), std::invalid_argument);
    REQUIRE_THROWS_AS(Dictionary({ "sales", "pales" }, 4), std::invalid_argument);
    REQUIRE_THROWS_AS(Dictionary({ "sale", "pale" }, 0), std::invalid_argument);
    REQUIRE_NOTHROW(Dictionary({ "sale", "pale" }, 4));
}

TEST_CASE("Dictionary sample uses the injected source", "[dictionary]")
{
    auto dict = fixtureDictionary();

    REQUIRE(dict->sample(scriptedSource({ 0 })) == "card");
    REQUIRE(dict->sample(scriptedSource({ 10 })) == "sale");
    REQUIRE(dict->sample(scriptedSource({ 17 })) == "xylo");
}

TEST_CASE("Dictionary sample with a seeded source only returns members", "[dictionary]")
{
    auto dict = fixtureDictionary();
    auto random = makeRandomSource(42);

    std::set<std::string> seen;
    for (int i = 0; i < 500; ++i) {
        auto w = dict->sample(random);
        REQUIRE(dict->contains(w));
        seen.insert(w);
    }
    REQUIRE(seen.size() > 1);
}

TEST_CASE("Seeded random sources are reproducible", "[dictionary]")
{
    auto a = makeRandomSource(7);
    auto b = makeRandomSource(7);
    for (int i = 0; i < 50; ++i) {
        size_t x = a(1000);
        REQUIRE(x < 1000);
        REQUIRE(x == b(1000));
    }
}
