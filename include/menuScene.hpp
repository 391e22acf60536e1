#pragma once
#include <raylib.h>
#include <memory>
#include <string>
#include <vector>
#include "scene.hpp"
#include "sceneManager.hpp"

class GlyphSheet;

struct MenuConfig
{
    const char *title = "PONG";
    float titleY = 40.0f;

    // Buttons
    float buttonWidth = 160.0f;
    float buttonHeight = 32.0f;
    float buttonSpacing = 12.0f;
    float buttonTopRatio = 0.42f; // Y of the first button as ratio of surface height
    int buttonFontSize = 20;
    Color buttonFill = {20, 20, 20, 255};
    Color uiColorNormal = {200, 200, 200, 255};
    Color uiColorHover = {255, 215, 0, 255}; // Gold
};

/**
 * @brief A menu entry. Activating it switches scene, or quits when `quit` is set.
 */
struct MenuButton
{
    std::string label;
    Rectangle bounds{0, 0, 0, 0};
    SceneId target = SceneId::Menu;
    bool quit = false;
};

/**
 * @brief Title screen with Play, Tutorial and Quit.
 *
 * Buttons are laid out once in `onInitialize()`. The mouse hovers and clicks
 * them; UP/DOWN move the keyboard selection and ENTER activates it. ESC quits.
 */
class MenuScene : public Scene
{
private:
    SceneManager &manager;
    MenuConfig config;
    std::shared_ptr<GlyphSheet> glyphs;
    std::vector<MenuButton> buttons;
    int selected = 0;

    void onInitialize() override;
    void activate(const MenuButton &button);
    int buttonAt(Vector2 position) const;

public:
    MenuScene(SceneManager &mgr, std::shared_ptr<GlyphSheet> glyphSheet, const MenuConfig &cfg = MenuConfig{});
    ~MenuScene() override = default;

    void update() override {}
    const RenderTexture2D &draw() override;
    void handleEvent(const InputEvent &event) override;

    const std::vector<MenuButton> &getButtons() const { return this->buttons; }
    int getSelected() const { return this->selected; }
};
