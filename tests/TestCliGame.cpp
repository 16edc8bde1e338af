#include <catch2/catch.hpp>

#include "CliGame.hpp"
#include "Fixtures.hpp"

#include <sstream>

namespace {

struct Session {
    Engine engine{ fixtureDictionary(), EngineConfig{}, makeRandomSource(5) };
    std::istringstream in;
    std::ostringstream out;

    std::string play(const std::string& input)
    {
        in.str(input);
        CliGame cli(engine, in, out);
        REQUIRE(cli.run() == 0);
        return out.str();
    }
};

bool has(const std::string& text, const std::string& part)
{
    return text.find(part) != std::string::npos;
}

} // namespace

TEST_CASE("CLI prints the board with feedback letters", "[cli]")
{
    Session s;
    auto text = s.play("pale\nexit\n");

    REQUIRE(has(text, "Start word: SALE"));
    REQUIRE(has(text, "Target word: OPAL"));
    REQUIRE(has(text, "No attempts yet"));
    REQUIRE(has(text, "1. PALE [YYYX]"));
    REQUIRE(has(text, "Thanks for playing!"));
    REQUIRE(s.engine.getAttempts() == std::vector<std::string>{ "pale" });
}

TEST_CASE("CLI reports invalid input only when errors are shown", "[cli]")
{
    SECTION("errors on")
    {
        Session s;
        auto text = s.play("pal\nzzzz\nexit\n");
        REQUIRE(has(text, "Error: Word must be 4 letters long"));
        REQUIRE(has(text, "Error: Invalid word."));
    }
    SECTION("errors off")
    {
        Session s;
        s.engine.setShowErrorMessages(false);
        auto text = s.play("pal\nzzzz\nexit\n");
        REQUIRE_FALSE(has(text, "Error:"));
        REQUIRE(s.engine.getAttempts().empty());
    }
}

TEST_CASE("CLI restart, new and set commands drive the engine", "[cli]")
{
    Session s;
    auto text = s.play("pale\nrestart\nset path on\nset colour on\nset path\nnew\nexit\n");

    REQUIRE(has(text, "Game reset."));
    REQUIRE(has(text, "Show path: true"));
    REQUIRE(has(text, "Path from SALE to OPAL:"));
    REQUIRE(has(text, "5. OPAL"));
    REQUIRE(has(text, "Unknown flag: colour"));
    REQUIRE(has(text, "Invalid command. Use 'set <flag> <value>'"));
    REQUIRE(has(text, "New game started."));
    REQUIRE(s.engine.isShowPath());
    REQUIRE(s.engine.getAttempts().empty());
}

TEST_CASE("CLI announces a win and offers another game", "[cli]")
{
    SECTION("decline")
    {
        Session s;
        auto text = s.play("oale\nople\nopae\nopal\nno\n");
        REQUIRE(has(text, "Congratulations! You won!"));
        REQUIRE(has(text, "You transformed SALE into OPAL in 4 attempts."));
        REQUIRE(has(text, "Thanks for playing!"));
        REQUIRE(s.engine.hasWon());
    }
    SECTION("accept")
    {
        Session s;
        s.play("oale\nople\nopae\nopal\nyes\nexit\n");
        REQUIRE_FALSE(s.engine.hasWon());
        REQUIRE(s.engine.getAttempts().empty());
    }
}

TEST_CASE("CLI stops cleanly at end of input", "[cli]")
{
    Session s;
    auto text = s.play("pale\n");
    REQUIRE(has(text, "1. PALE"));
    REQUIRE_FALSE(has(text, "Thanks for playing!"));
}
