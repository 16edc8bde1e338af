#include "Engine.hpp"
#include "Log.hpp"
#include "WordLadder.hpp"
#include <stdexcept>

namespace {
    const char* kTag = "engine";
}

Engine::Engine(std::shared_ptr<const Dictionary> dict, EngineConfig cfg, RandomSource random)
    : m_dict(std::move(dict)), m_cfg(std::move(cfg)), m_random(std::move(random)) {
    if (!m_dict) throw std::invalid_argument("engine needs a dictionary");
    if (!m_random) throw std::invalid_argument("engine needs a random source");
    if (m_dict->wordLength() != m_cfg.wordLength) {
        throw std::invalid_argument("dictionary word length " + std::to_string(m_dict->wordLength())
                                    + " does not match configured length " + std::to_string(m_cfg.wordLength));
    }
    m_cfg.defaultStart = Dictionary::toLower(m_cfg.defaultStart);
    m_cfg.defaultTarget = Dictionary::toLower(m_cfg.defaultTarget);
    if (!m_dict->contains(m_cfg.defaultStart) || !m_dict->contains(m_cfg.defaultTarget)) {
        throw std::invalid_argument("default words '" + m_cfg.defaultStart + "' and '"
                                    + m_cfg.defaultTarget + "' must both be in the dictionary");
    }
    if (m_cfg.defaultStart == m_cfg.defaultTarget) {
        throw std::invalid_argument("default start and target words must differ");
    }
    if (m_cfg.maxTargetDraws < 1) m_cfg.maxTargetDraws = 1;

    clearAttempts();
    pickWords();
}

void Engine::pickWords() {
    if (!m_cfg.randomWords) {
        m_start = m_cfg.defaultStart;
        m_target = m_cfg.defaultTarget;
        return;
    }
    m_start = m_dict->sample(m_random);
    for (int i = 0; i < m_cfg.maxTargetDraws; ++i) {
        m_target = m_dict->sample(m_random);
        if (m_target != m_start) {
            Log::info(kTag, "new words: " + m_start + " -> " + m_target);
            return;
        }
    }
    // dictionary holds at least two words, so this always finds one
    for (const auto& w : m_dict->words()) {
        if (w != m_start) { m_target = w; break; }
    }
    Log::warn(kTag, "random target kept matching start after "
                    + std::to_string(m_cfg.maxTargetDraws) + " draws, using " + m_target);
}

void Engine::clearAttempts() {
    m_attempts.clear();
    m_currentAttempt = 0;
}

bool Engine::isValidWord(const std::string& word) const {
    auto w = Dictionary::toLower(word);
    if (!m_dict->contains(w)) return false;
    const std::string& prev = m_attempts.empty() ? m_start : m_attempts.back();
    return WordLadder::differsByOneLetter(prev, w);
}

bool Engine::submitWord(const std::string& word) {
    auto w = Dictionary::toLower(word);
    if (!isValidWord(w)) {
        Log::debug(kTag, "rejected '" + w + "'");
        return false;
    }
    m_attempts.push_back(w);
    m_currentAttempt++;
    notify();
    return true;
}

bool Engine::hasWon() const {
    return !m_attempts.empty() && m_attempts.back() == m_target;
}

SessionState Engine::state() const {
    if (m_attempts.empty()) return SessionState::Fresh;
    return hasWon() ? SessionState::Won : SessionState::InProgress;
}

void Engine::resetGame() {
    clearAttempts();
    notify();
}

void Engine::newGame() {
    clearAttempts();
    pickWords();
    notify();
}

void Engine::setShowErrorMessages(bool on) {
    m_cfg.showErrorMessages = on;
    notify();
}

void Engine::setShowPath(bool on) {
    m_cfg.showPath = on;
    notify();
}

void Engine::setRandomWords(bool on) {
    m_cfg.randomWords = on;
    newGame();
}

std::vector<std::string> Engine::findPath() const {
    return WordLadder::findPath(*m_dict, m_start, m_target);
}

// Containment only: a letter repeated in the guess is marked Present at every
// position where it is not Correct, whatever the target's count of it.
std::vector<TileState> Engine::getFeedback(const std::string& word) const {
    auto w = Dictionary::toLower(word);
    std::vector<TileState> out(m_cfg.wordLength, TileState::Absent);
    for (size_t i = 0; i < out.size() && i < w.size(); ++i) {
        if (w[i] == m_target[i]) out[i] = TileState::Correct;
        else if (m_target.find(w[i]) != std::string::npos) out[i] = TileState::Present;
    }
    return out;
}

int Engine::subscribe(Listener fn) {
    int id = m_nextListenerId++;
    m_listeners.emplace(id, std::move(fn));
    return id;
}

void Engine::unsubscribe(int id) {
    m_listeners.erase(id);
}

void Engine::notify() {
    auto listeners = m_listeners; // a listener may unsubscribe while we iterate
    for (auto& kv : listeners) {
        if (kv.second) kv.second();
    }
}
