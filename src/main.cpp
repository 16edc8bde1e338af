#include <SFML/Graphics.hpp>
#include <imgui.h>
#include <imgui-SFML.h>
#include "Game.hpp"
#include "Log.hpp"
#include <memory>
#include <stdexcept>

int main(int argc, char* argv[]) {
    GameConfig cfg;
    if (argc > 1) cfg.dictPath = argv[1];

    std::unique_ptr<Game> game;
    try {
        game = std::make_unique<Game>(cfg);
    } catch (const std::invalid_argument& e) {
        Log::error("gui", e.what());
        return 1;
    }

    sf::RenderWindow window(sf::VideoMode(1000, 800), "Weaver");
    window.setFramerateLimit(60);
    ImGui::SFML::Init(window);

    ImGuiStyle& style = ImGui::GetStyle();
    style.FrameRounding = 8.f;
    style.ScrollbarRounding = 8.f;
    style.WindowRounding = 8.f;

    sf::Clock deltaClock;
    bool wantQuit = false;

    while (window.isOpen() && !wantQuit) {
        sf::Event event{};
        while (window.pollEvent(event)) {
            ImGui::SFML::ProcessEvent(event);
            if (event.type == sf::Event::Closed) window.close();
            if (event.type == sf::Event::TextEntered) game->onTextEntered(event.text.unicode);
            if (event.type == sf::Event::KeyPressed) {
                if (event.key.code == sf::Keyboard::Escape) wantQuit = true;
                game->onKeyPressed(event.key.code);
            }
        }

        float dt = deltaClock.restart().asSeconds();
        ImGui::SFML::Update(window, sf::seconds(dt));
        game->update(dt);

        if (game->wantsToQuit()) wantQuit = true;

        window.clear(sf::Color(20, 20, 26));
        game->renderUI();
        ImGui::SFML::Render(window);
        window.display();
    }

    ImGui::SFML::Shutdown();
    return 0;
}
