#pragma once
#include "Engine.hpp"
#include <iosfwd>
#include <string>

// Line-oriented text front end. Polls the engine after each command.
class CliGame {
public:
    CliGame(Engine& engine, std::istream& in, std::ostream& out);

    int run();

    // Handles one input line; false once the player asked to quit.
    bool handleLine(const std::string& line);

private:
    void printWelcome();
    void printState();
    void printPath();
    void printWin();
    void printError(const std::string& msg);
    void handleSet(const std::string& args);

private:
    Engine& m_engine;
    std::istream& m_in;
    std::ostream& m_out;
    bool m_awaitingReplay = false;
};
