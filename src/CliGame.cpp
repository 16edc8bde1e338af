#include "CliGame.hpp"
#include "Dictionary.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

namespace {
    std::string toUpper(std::string s) {
        for (auto& c : s) c = (char)std::toupper((unsigned char)c);
        return s;
    }
    std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace((unsigned char)s[b])) ++b;
        while (e > b && std::isspace((unsigned char)s[e-1])) --e;
        return s.substr(b, e - b);
    }
    char tileChar(TileState t) {
        switch (t) {
        case TileState::Correct: return 'G';
        case TileState::Present: return 'Y';
        default: return 'X';
        }
    }
    const char* kRule = "---------------------------";
}

CliGame::CliGame(Engine& engine, std::istream& in, std::ostream& out)
    : m_engine(engine), m_in(in), m_out(out) {}

int CliGame::run() {
    printWelcome();
    printState();
    std::string line;
    while (true) {
        m_out << (m_awaitingReplay ? "Would you like to play again? (yes/no): " : "Enter a word: ");
        m_out.flush();
        if (!std::getline(m_in, line)) break;
        if (!handleLine(line)) break;
    }
    return 0;
}

bool CliGame::handleLine(const std::string& line) {
    std::string input = Dictionary::toLower(trim(line));

    if (m_awaitingReplay) {
        m_awaitingReplay = false;
        if (input == "yes" || input == "y") {
            m_engine.newGame();
            printState();
            return true;
        }
        m_out << "Thanks for playing!\n";
        return false;
    }

    if (input == "exit") {
        m_out << "Thanks for playing!\n";
        return false;
    }
    if (input == "restart") {
        m_engine.resetGame();
        m_out << "Game reset.\n";
        printState();
        return true;
    }
    if (input == "new") {
        m_engine.newGame();
        m_out << "New game started.\n";
        printState();
        return true;
    }
    if (input == "path") {
        printPath();
        return true;
    }
    if (input.rfind("set ", 0) == 0) {
        handleSet(input.substr(4));
        return true;
    }
    if (input.empty()) return true;

    if ((int)input.size() != m_engine.dictionary().wordLength()) {
        printError("Word must be " + std::to_string(m_engine.dictionary().wordLength()) + " letters long");
        return true;
    }
    if (!m_engine.submitWord(input)) {
        printError("Invalid word. It must be in the dictionary and differ by exactly one letter from the previous word.");
        return true;
    }
    printState();
    if (m_engine.hasWon()) {
        printWin();
        m_awaitingReplay = true;
    }
    return true;
}

void CliGame::handleSet(const std::string& args) {
    std::istringstream ss(args);
    std::string flag, value, extra;
    if (!(ss >> flag >> value) || (ss >> extra)) {
        m_out << "Invalid command. Use 'set <flag> <value>'\n";
        return;
    }
    bool on = (value == "true" || value == "on" || value == "1");

    if (flag == "errors") {
        m_engine.setShowErrorMessages(on);
        m_out << "Show error messages: " << (on ? "true" : "false") << "\n";
    } else if (flag == "path") {
        m_engine.setShowPath(on);
        m_out << "Show path: " << (on ? "true" : "false") << "\n";
        if (on) printPath();
    } else if (flag == "random") {
        m_engine.setRandomWords(on);
        m_out << "Random words: " << (on ? "true" : "false") << "\n";
        printState();
    } else {
        m_out << "Unknown flag: " << flag << "\n";
        m_out << "Available flags: errors, path, random\n";
    }
}

void CliGame::printWelcome() {
    m_out << "Welcome to Weaver!\n"
          << "Change one letter at a time to transform the start word into the target word.\n"
          << "All intermediate steps must be valid words.\n"
          << "Type 'exit' to quit, 'restart' to reset the game, 'new' for a new game,\n"
          << "'path' to see a shortest solution, or 'set <errors|path|random> <on|off>'.\n\n";
}

void CliGame::printState() {
    m_out << "\n" << kRule << "\n";
    m_out << "Start word: " << toUpper(m_engine.startWord()) << "\n";
    m_out << "Target word: " << toUpper(m_engine.targetWord()) << "\n";
    m_out << kRule << "\n";

    auto attempts = m_engine.getAttempts();
    if (attempts.empty()) {
        m_out << "No attempts yet\n";
    } else {
        m_out << "Your attempts:\n";
        for (size_t i = 0; i < attempts.size(); ++i) {
            m_out << (i + 1) << ". " << toUpper(attempts[i]) << " [";
            for (auto t : m_engine.getFeedback(attempts[i])) m_out << tileChar(t);
            m_out << "]\n";
        }
    }
    m_out << kRule << "\n";

    if (m_engine.isShowPath()) printPath();
}

void CliGame::printPath() {
    auto path = m_engine.findPath();
    const auto from = toUpper(m_engine.startWord());
    const auto to = toUpper(m_engine.targetWord());
    if (path.empty()) {
        m_out << "No path found from " << from << " to " << to << "\n";
        return;
    }
    m_out << "Path from " << from << " to " << to << ":\n";
    for (size_t i = 0; i < path.size(); ++i) {
        m_out << (i + 1) << ". " << toUpper(path[i]) << "\n";
    }
    m_out << kRule << "\n";
}

void CliGame::printWin() {
    m_out << "\n*******************************\n"
          << "Congratulations! You won!\n"
          << "You transformed " << toUpper(m_engine.startWord()) << " into "
          << toUpper(m_engine.targetWord()) << " in " << m_engine.currentAttempt() << " attempts.\n"
          << "*******************************\n\n";
}

void CliGame::printError(const std::string& msg) {
    if (m_engine.isShowErrorMessages()) m_out << "Error: " << msg << "\n";
}
