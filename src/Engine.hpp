#pragma once
#include "Dictionary.hpp"
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

enum class TileState : int { Absent = 0, Present = 1, Correct = 2 };

enum class SessionState : int { Fresh = 0, InProgress = 1, Won = 2 };

struct EngineConfig {
    int wordLength = 4;
    std::string defaultStart = "sale";  // used when randomWords is off
    std::string defaultTarget = "opal";
    bool showErrorMessages = true;
    bool showPath = false;
    bool randomWords = false;
    int maxTargetDraws = 64;            // redraws before falling back to a fixed pick
};

// One Weaver session over a shared read-only dictionary. Not thread safe;
// confine an Engine to one thread, share the Dictionary freely.
class Engine {
public:
    using Listener = std::function<void()>;

    // Throws std::invalid_argument if the dictionary length differs from the
    // config, or the default pair is not two distinct dictionary words.
    explicit Engine(std::shared_ptr<const Dictionary> dict, EngineConfig cfg = {},
                    RandomSource random = makeRandomSource(std::random_device{}()));

    // gameplay
    bool submitWord(const std::string& word);
    bool isValidWord(const std::string& word) const;
    bool hasWon() const;
    void resetGame();
    void newGame();

    std::vector<std::string> findPath() const;
    std::vector<TileState> getFeedback(const std::string& word) const;
    std::vector<std::string> getAttempts() const { return m_attempts; }

    // flags
    void setShowErrorMessages(bool on);
    void setShowPath(bool on);
    void setRandomWords(bool on); // always starts a new game
    bool isShowErrorMessages() const { return m_cfg.showErrorMessages; }
    bool isShowPath() const { return m_cfg.showPath; }
    bool isRandomWords() const { return m_cfg.randomWords; }

    // change notification, fired once after every mutating call
    int subscribe(Listener fn);
    void unsubscribe(int id);

    const std::string& startWord() const { return m_start; }
    const std::string& targetWord() const { return m_target; }
    int currentAttempt() const { return m_currentAttempt; }
    SessionState state() const;
    const Dictionary& dictionary() const { return *m_dict; }
    const EngineConfig& config() const { return m_cfg; }

private:
    void pickWords();
    void clearAttempts();
    void notify();

private:
    std::shared_ptr<const Dictionary> m_dict;
    EngineConfig m_cfg;
    RandomSource m_random;

    std::string m_start;
    std::string m_target;
    std::vector<std::string> m_attempts;
    int m_currentAttempt = 0;

    std::map<int, Listener> m_listeners;
    int m_nextListenerId = 1;
};
