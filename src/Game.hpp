#pragma once
#include "Engine.hpp"
#include <SFML/Graphics.hpp>
#include <imgui.h>
#include <memory>
#include <string>
#include <vector>

struct GameConfig {
    std::string dictPath = "assets/words.txt";
    uint64_t seed = 0;          // 0 = seed from std::random_device
    EngineConfig engine{};
};

// SFML/ImGui front end. Keeps a cached view of the engine, rebuilt on every
// engine notification.
class Game {
public:
    explicit Game(const GameConfig& cfg = GameConfig{});
    ~Game();

    // input
    bool onTextEntered(sf::Uint32 unicode);
    bool onKeyPressed(sf::Keyboard::Key key);

    // logic
    void update(float dt);
    void renderUI();

    // expose
    const Engine& engine() const { return *m_engine; }
    bool wantsToQuit() const { return m_wantsToQuit; }

private:
    void refresh();
    void submitCurrent();
    void showError(const std::string& msg, float seconds);

    // drawing helpers
    void drawTile(int id, char ch, const ImVec4& fill, float flip);
    void drawRow(int row, const std::string& word, const std::vector<TileState>* states, const ImVec4& neutral);
    void drawBoard(float height);
    void drawKeyboard();
    void topMenu();
    void footer();

private:
    GameConfig m_cfg{};
    std::unique_ptr<Engine> m_engine;
    int m_listenerId = 0;

    // cached view of the engine
    std::vector<std::string> m_rows;
    std::vector<std::vector<TileState>> m_states;
    std::vector<std::string> m_path;
    std::string m_shownStart;
    std::string m_shownTarget;
    bool m_win = false;
    std::string m_current;

    float m_msgTimer = 0.f;
    std::string m_msg;

    // keyboard heatmap targets [-1..2] and animated value [0..1]
    int   m_keyState[26] = {0};      // -1 not in target, 1 present, 2 correct
    float m_keyAnim[26]  = {0.f};

    // tile flip animation per attempt row
    std::vector<std::vector<float>> m_flip;
    float m_flipSpeed = 6.f;
    bool m_scrollToBottom = false;

    // layout cache
    float m_tileSize = 56.f;
    float m_tileGap = 8.f;

    bool m_wantsToQuit = false;
};
