#include "menuScene.hpp"
#include "glyphSheet.hpp"
#include <utility>

MenuScene::MenuScene(SceneManager &mgr, std::shared_ptr<GlyphSheet> glyphSheet, const MenuConfig &cfg)
    : manager(mgr), config(cfg), glyphs(std::move(glyphSheet))
{
    this->sceneSettings.title = "Pong";
    this->sceneSettings.eventsFilter = {
        InputEvent::Type::KeyPressed,
        InputEvent::Type::MouseButtonPressed,
        InputEvent::Type::MouseMoved,
    };
}

void MenuScene::onInitialize()
{
    this->buttons = {
        {"Play", {}, SceneId::Game, false},
        {"Tutorial", {}, SceneId::Tutorial, false},
        {"Quit", {}, SceneId::Menu, true},
    };

    float x = (this->sceneSettings.size.x - this->config.buttonWidth) / 2.0f;
    float y = this->sceneSettings.size.y * this->config.buttonTopRatio;
    for (MenuButton &b : this->buttons)
    {
        b.bounds = {x, y, this->config.buttonWidth, this->config.buttonHeight};
        y += this->config.buttonHeight + this->config.buttonSpacing;
    }
    this->selected = 0;
}

int MenuScene::buttonAt(Vector2 position) const
{
    for (size_t i = 0; i < this->buttons.size(); i++)
    {
        if (CheckCollisionPointRec(position, this->buttons[i].bounds))
            return (int)i;
    }
    return -1;
}

void MenuScene::activate(const MenuButton &button)
{
    if (button.quit)
    {
        this->manager.requestClose();
        return;
    }
    this->manager.setActive(button.target);
}

void MenuScene::handleEvent(const InputEvent &event)
{
    if (this->buttons.empty())
        return;

    int count = (int)this->buttons.size();
    switch (event.type)
    {
    case InputEvent::Type::MouseMoved:
    {
        int hit = this->buttonAt(event.position);
        if (hit >= 0)
            this->selected = hit;
        break;
    }
    case InputEvent::Type::MouseButtonPressed:
    {
        if (event.button != MOUSE_BUTTON_LEFT)
            break;
        int hit = this->buttonAt(event.position);
        if (hit >= 0)
        {
            this->selected = hit;
            this->activate(this->buttons[hit]);
        }
        break;
    }
    case InputEvent::Type::KeyPressed:
        if (event.key == KEY_UP || event.key == KEY_W)
            this->selected = (this->selected - 1 + count) % count;
        else if (event.key == KEY_DOWN || event.key == KEY_S)
            this->selected = (this->selected + 1) % count;
        else if (event.key == KEY_ENTER || event.key == KEY_SPACE)
            this->activate(this->buttons[this->selected]);
        else if (event.key == KEY_ESCAPE)
            this->manager.requestClose();
        break;
    }
}

const RenderTexture2D &MenuScene::draw()
{
    if (!this->ensureSurface())
        return this->surface;

    if (this->glyphs && !this->glyphs->isGenerated())
        this->glyphs->generate();

    BeginTextureMode(this->surface);
    ClearBackground(BLACK);

    // Title, centred
    if (this->glyphs)
    {
        float width = this->glyphs->getAdvance() * (float)TextLength(this->config.title);
        this->glyphs->drawText(this->config.title, {(this->sceneSettings.size.x - width) / 2.0f, this->config.titleY}, WHITE);
    }

    for (size_t i = 0; i < this->buttons.size(); i++)
    {
        const MenuButton &b = this->buttons[i];
        Color c = ((int)i == this->selected) ? this->config.uiColorHover : this->config.uiColorNormal;
        DrawRectangleRec(b.bounds, this->config.buttonFill);
        DrawRectangleLinesEx(b.bounds, 2.0f, c);

        int textWidth = MeasureText(b.label.c_str(), this->config.buttonFontSize);
        int tx = (int)(b.bounds.x + (b.bounds.width - textWidth) / 2.0f);
        int ty = (int)(b.bounds.y + (b.bounds.height - this->config.buttonFontSize) / 2.0f);
        DrawText(b.label.c_str(), tx, ty, this->config.buttonFontSize, c);
    }

    EndTextureMode();
    return this->surface;
}
