#include "Game.hpp"
#include "Log.hpp"
#include "WordList.hpp"
#include <imgui-SFML.h>
#include <imgui.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <random>

namespace {
    ImVec4 colAbsent    = ImVec4(0.12f, 0.12f, 0.14f, 1.0f);
    ImVec4 colPresent   = ImVec4(0.85f, 0.65f, 0.15f, 1.0f);
    ImVec4 colCorrect   = ImVec4(0.40f, 0.85f, 0.45f, 1.0f);
    ImVec4 colWrong     = ImVec4(0.70f, 0.20f, 0.20f, 1.0f); // letters not in the target
    ImVec4 colEndpoint  = ImVec4(0.28f, 0.32f, 0.45f, 1.0f); // start / target rows
    ImVec4 colInput     = ImVec4(0.20f, 0.20f, 0.24f, 1.0f);
    ImVec4 colTileFrame = ImVec4(0.25f, 0.25f, 0.30f, 1.0f);
    ImVec4 colBg        = ImVec4(0.08f, 0.08f, 0.10f, 1.0f);

    const char* kbdRows[3] = {
        "QWERTYUIOP",
        "ASDFGHJKL",
        "ZXCVBNM"
    };

    std::string toUpper(std::string s) {
        for (auto& c : s) c = (char)std::toupper((unsigned char)c);
        return s;
    }
}

Game::Game(const GameConfig& cfg) : m_cfg(cfg) {
    uint64_t seed = m_cfg.seed;
    if (seed == 0) {
        std::random_device rd;
        seed = rd();
    }
    auto dict = std::make_shared<const Dictionary>(
        WordList::load(m_cfg.dictPath, m_cfg.engine.wordLength), m_cfg.engine.wordLength);
    m_engine = std::make_unique<Engine>(dict, m_cfg.engine, makeRandomSource(seed));
    m_listenerId = m_engine->subscribe([this]{ refresh(); });
    refresh();
}

Game::~Game() {
    m_engine->unsubscribe(m_listenerId);
}

void Game::refresh() {
    auto attempts = m_engine->getAttempts();
    bool restarted = attempts.size() < m_rows.size()
        || m_engine->startWord() != m_shownStart || m_engine->targetWord() != m_shownTarget;
    bool grew = attempts.size() > m_rows.size();
    if (restarted) {
        m_current.clear();
        m_flip.clear();
        for (int i=0;i<26;++i) m_keyAnim[i] = 0.f;
        m_shownStart = m_engine->startWord();
        m_shownTarget = m_engine->targetWord();
    }

    m_rows = attempts;
    m_states.clear();
    for (auto& w : m_rows) m_states.push_back(m_engine->getFeedback(w));

    const int len = m_engine->dictionary().wordLength();
    while (m_flip.size() < m_rows.size()) {
        m_flip.emplace_back(len, grew ? 0.f : 1.f);
    }

    std::fill(std::begin(m_keyState), std::end(m_keyState), 0);
    for (size_t r=0; r<m_rows.size(); ++r) {
        for (int i=0;i<len;++i) {
            int idx = m_rows[r][i]-'a';
            if (idx < 0 || idx >= 26) continue;
            TileState st = m_states[r][i];
            if (st == TileState::Correct) m_keyState[idx] = 2;
            else if (st == TileState::Present) m_keyState[idx] = std::max(m_keyState[idx], 1);
            else m_keyState[idx] = -1;
        }
    }

    m_win = m_engine->hasWon();
    m_path = m_engine->isShowPath() ? m_engine->findPath() : std::vector<std::string>{};
    m_scrollToBottom = true;
}

void Game::showError(const std::string& msg, float seconds) {
    Log::debug("gui", msg);
    if (!m_engine->isShowErrorMessages()) return;
    m_msg = msg; m_msgTimer = seconds;
}

bool Game::onTextEntered(sf::Uint32 uni) {
    if (m_win) return false;
    if (uni >= 32 && uni < 128) {
        char c = (char)uni;
        if (std::isalpha((unsigned char)c)) {
            if ((int)m_current.size() < m_engine->dictionary().wordLength()) {
                m_current.push_back((char)std::tolower((unsigned char)c));
                return true;
            }
        }
    }
    return false;
}

bool Game::onKeyPressed(sf::Keyboard::Key key) {
    if (key == sf::Keyboard::Backspace) {
        if (!m_current.empty()) {
            m_current.pop_back();
            return true;
        }
    } else if (key == sf::Keyboard::Enter || key == sf::Keyboard::Return) {
        submitCurrent();
        return true;
    }
    return false;
}

void Game::submitCurrent() {
    if (m_win) return;
    const int len = m_engine->dictionary().wordLength();
    if ((int)m_current.size() != len) {
        showError("Word must be " + std::to_string(len) + " letters long", 1.5f);
        return;
    }
    if (!m_engine->isValidWord(m_current)) {
        showError("Invalid word: " + toUpper(m_current) +
                  ". It must be in the dictionary and differ by exactly one letter from the previous word.", 2.5f);
        return;
    }
    std::string word = m_current;
    m_current.clear();
    if (!m_engine->submitWord(word)) {
        Log::error("gui", "engine refused a validated word: " + word);
    }
}

void Game::update(float dt) {
    if (m_msgTimer > 0.f) { m_msgTimer -= dt; if (m_msgTimer < 0.f) m_msgTimer = 0.f; }
    for (int i=0;i<26;++i) {
        float target;
        if (m_keyState[i] == 2) target = 1.f;
        else if (m_keyState[i] == 1) target = 0.7f;
        else if (m_keyState[i] == -1) target = 0.8f;
        else target = 0.f;
        float a = m_keyAnim[i];
        a += (target - a) * (dt * 6.f);
        if (a < 0.001f) a = 0.f;
        if (a > 0.999f) a = target;
        m_keyAnim[i] = a;
    }
    for (auto& row : m_flip) {
        for (float& f : row) {
            if (f < 1.f) f = std::min(1.f, f + dt * m_flipSpeed);
        }
    }
}

void Game::drawTile(int id, char ch, const ImVec4& fill, float flip) {
    float scaleY = 1.f;
    if (m_win) flip = 1.f;
    if (flip < 0.5f) scaleY = 1.f - (flip*2.f);
    else             scaleY = (flip - 0.5f)*2.f;
    ImVec4 drawCol = (flip < 0.5f ? colAbsent : fill);

    ImGui::PushStyleColor(ImGuiCol_Button, drawCol);
    ImGui::PushStyleColor(ImGuiCol_ButtonHovered, drawCol);
    ImGui::PushStyleColor(ImGuiCol_ButtonActive, drawCol);
    ImGui::PushStyleColor(ImGuiCol_Border, colTileFrame);

    ImGui::PushID(id);
    ImGui::Button("   ", ImVec2(m_tileSize, m_tileSize));
    ImVec2 p = ImGui::GetItemRectMin();
    ImVec2 s = ImGui::GetItemRectSize();

    ImGui::PushClipRect(ImVec2(p.x, p.y), ImVec2(p.x + s.x, p.y + s.y), true);
    ImGui::SetWindowFontScale(scaleY > 0.0f ? scaleY : 0.0001f);
    if (std::isalpha((unsigned char)ch)) {
        float textWidth = 10.0f;
        float textHeight = 20.0f;
        ImGui::SetCursorScreenPos(ImVec2(p.x + (s.x - textWidth) * 0.5f, p.y + (s.y - textHeight) * 0.5f));
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.96f, 0.97f, 1.0f, 1.0f));
        ImGui::Text("%c", (char)std::toupper((unsigned char)ch));
        ImGui::PopStyleColor();
    }
    ImGui::SetWindowFontScale(1.f);
    ImGui::PopClipRect();
    ImGui::PopID();

    ImGui::PopStyleColor(4);
}

// states == nullptr draws every tile in `neutral`
void Game::drawRow(int row, const std::string& word, const std::vector<TileState>* states, const ImVec4& neutral) {
    const int len = m_engine->dictionary().wordLength();
    float boardW = len * m_tileSize + (len - 1) * m_tileGap;
    float startX = (ImGui::GetWindowSize().x - boardW) * 0.5f;
    float y = ImGui::GetCursorPosY();

    for (int c=0;c<len;++c) {
        ImGui::SetCursorPos(ImVec2(startX + c * (m_tileSize + m_tileGap), y));
        ImVec4 fill = neutral;
        float flip = 1.f;
        if (states) {
            TileState ts = (*states)[c];
            if (ts == TileState::Present) fill = colPresent;
            else if (ts == TileState::Correct) fill = colCorrect;
            else fill = colAbsent;
            if (row > 0 && row - 1 < (int)m_flip.size()) flip = m_flip[row - 1][c];
        }
        char ch = c < (int)word.size() ? word[c] : ' ';
        drawTile(row*100 + c, ch, fill, flip);
    }
    ImGui::SetCursorPos(ImVec2(0, y + m_tileSize + m_tileGap));
}

void Game::drawBoard(float height) {
    ImGui::PushStyleVar(ImGuiStyleVar_FrameRounding, 8.f);
    ImGui::PushStyleVar(ImGuiStyleVar_FrameBorderSize, 1.f);
    ImGui::BeginChild("board", ImVec2(0, height), false);

    int row = 0;
    drawRow(row++, m_engine->startWord(), nullptr, colEndpoint);
    for (size_t r=0; r<m_rows.size(); ++r) {
        drawRow(row++, m_rows[r], &m_states[r], colAbsent);
    }
    if (!m_win) drawRow(row++, m_current, nullptr, colInput);
    drawRow(row++, m_engine->targetWord(), nullptr, colEndpoint);

    if (m_scrollToBottom) {
        ImGui::SetScrollHereY(1.0f);
        m_scrollToBottom = false;
    }
    ImGui::EndChild();
    ImGui::PopStyleVar(2);
}

void Game::drawKeyboard() {
    ImGui::Dummy(ImVec2(0, 8));

    float keyWidth = 48.f;
    float keyHeight = 56.f;
    float keyGap = 8.f;

    for (int ri=0; ri<3; ++ri) {
        const char* row = kbdRows[ri];
        int n = (int)std::strlen(row);

        float rowWidth = n * keyWidth + (n - 1) * keyGap;
        float availWidth = ImGui::GetContentRegionAvail().x;
        float startX = (availWidth - rowWidth) * 0.5f;
        if (startX > 0) {
            ImGui::Dummy(ImVec2(startX, 0));
            ImGui::SameLine();
        }

        for (int i=0;i<n;++i) {
            char ch = row[i];
            int idx = ch - 'A';
            float a = m_keyAnim[idx];
            ImVec4 target;
            if (m_keyState[idx] == 2) target = colCorrect;
            else if (m_keyState[idx] == 1) target = colPresent;
            else if (m_keyState[idx] == -1) target = colWrong;
            else target = colAbsent;
            ImVec4 base = colAbsent;
            ImVec4 fill = ImVec4(base.x + (target.x-base.x)*a,
                                 base.y + (target.y-base.y)*a,
                                 base.z + (target.z-base.z)*a,
                                 1.0f);
            ImGui::PushStyleColor(ImGuiCol_Button, fill);
            ImGui::PushStyleColor(ImGuiCol_ButtonHovered, fill);
            ImGui::PushStyleColor(ImGuiCol_ButtonActive, fill);
            if (ImGui::Button(std::string(1, ch).c_str(), ImVec2(keyWidth, keyHeight))) {
                onTextEntered((sf::Uint32)ch);
            }
            ImGui::PopStyleColor(3);
            if (i+1<n) ImGui::SameLine(0, keyGap);
        }
        if (ri < 2) ImGui::Dummy(ImVec2(0, 6));
    }
}

void Game::topMenu() {
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("game")) {
            if (ImGui::MenuItem("new game")) {
                m_engine->newGame();
            }
            if (ImGui::MenuItem("reset (same words)")) {
                m_engine->resetGame();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("quit")) {
                m_wantsToQuit = true;
            }
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("settings")) {
            bool errors = m_engine->isShowErrorMessages();
            if (ImGui::Checkbox("show error messages", &errors)) {
                m_engine->setShowErrorMessages(errors);
            }
            bool path = m_engine->isShowPath();
            if (ImGui::Checkbox("show path", &path)) {
                m_engine->setShowPath(path);
            }
            bool random = m_engine->isRandomWords();
            if (ImGui::Checkbox("random words", &random)) {
                m_engine->setRandomWords(random);
            }
            ImGui::EndMenu();
        }
        ImGui::EndMainMenuBar();
    }
}

void Game::footer() {
    ImGui::Dummy(ImVec2(0, 8));
    ImGui::Separator();

    if (m_engine->isShowPath()) {
        ImGui::TextDisabled("path:");
        ImGui::SameLine();
        if (m_path.empty()) {
            ImGui::Text("no path found from %s to %s",
                toUpper(m_engine->startWord()).c_str(), toUpper(m_engine->targetWord()).c_str());
        } else {
            std::string s;
            for (size_t i=0;i<m_path.size();++i) {
                if (i) s += " > ";
                s += toUpper(m_path[i]);
            }
            ImGui::TextWrapped("%s (%d steps)", s.c_str(), (int)m_path.size() - 1);
        }
    }

    if (m_win) {
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.6f, 1.0f, 0.6f, 1.0f));
        ImGui::Text("you transformed %s into %s in %d attempts!",
            toUpper(m_engine->startWord()).c_str(), toUpper(m_engine->targetWord()).c_str(),
            m_engine->currentAttempt());
        ImGui::PopStyleColor();
    }

    if (m_msgTimer > 0.f && !m_msg.empty()) {
        ImGui::Separator();
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.f, 0.6f, 0.6f, 1.f));
        ImGui::TextWrapped("%s", m_msg.c_str());
        ImGui::PopStyleColor();
    }

    ImGui::Dummy(ImVec2(0, 10));
}

void Game::renderUI() {
    ImGui::PushStyleColor(ImGuiCol_WindowBg, colBg);
    ImGui::Begin("##root", nullptr,
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoBringToFrontOnFocus);
    ImGui::SetWindowPos(ImVec2(0, 0));
    ImGui::SetWindowSize(ImGui::GetIO().DisplaySize);

    topMenu();
    ImGui::SetCursorPos(ImVec2(10, 26));
    ImGui::TextDisabled("%s -> %s  |  attempts: %d  |  words: %s",
        toUpper(m_engine->startWord()).c_str(), toUpper(m_engine->targetWord()).c_str(),
        m_engine->currentAttempt(), (m_engine->isRandomWords() ? "random" : "fixed"));

    ImVec2 display = ImGui::GetIO().DisplaySize;
    float footerH = 300.f;
    float bottomMargin = 30.f;
    float topBarH = 50.f;
    float boardH = display.y - topBarH - footerH - bottomMargin;
    if (boardH < m_tileSize) boardH = m_tileSize;

    ImGui::SetCursorPos(ImVec2(0, topBarH));
    drawBoard(boardH);

    float footerW = 800.f;
    ImGui::SetCursorPos(ImVec2((display.x - footerW) * 0.5f, display.y - footerH - bottomMargin));
    ImGui::BeginChild("footer", ImVec2(footerW, footerH - 10.f), true);
    drawKeyboard();
    footer();
    ImGui::EndChild();

    ImGui::End();
    ImGui::PopStyleColor();
}
