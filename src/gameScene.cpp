#include "gameScene.hpp"
#include "sceneManager.hpp"
#include "glyphSheet.hpp"
#include <string>
#include <utility>

GameScene::GameScene(SceneManager &mgr, GameMode gameMode, std::shared_ptr<GlyphSheet> glyphSheet)
    : manager(mgr), mode(gameMode), glyphs(std::move(glyphSheet))
{
    this->sceneSettings.title = (gameMode == GameMode::Tutorial) ? "Pong Tutorial" : "Pong";
    this->sceneSettings.eventsFilter = {InputEvent::Type::KeyPressed};

    if (gameMode == GameMode::Tutorial)
    {
        this->tutorial = std::make_unique<TutorialOverlay>();
        this->bot = std::make_unique<TutorialBotPolicy>(&this->tutorial->getStateMachine());
    }
    else
    {
        this->bot = std::make_unique<BasicBotPolicy>();
    }

    float w = this->sceneSettings.size.x;
    float h = this->sceneSettings.size.y;
    this->background = {
        {10.0f, 10.0f, 10.0f, h - 20.0f},          // left wall
        {10.0f, 10.0f, w - 20.0f, 10.0f},          // top wall
        {w - 20.0f, 10.0f, 10.0f, h - 20.0f},      // right wall
        {10.0f, h - 20.0f, w - 20.0f, 10.0f},      // bottom wall
        {w / 2.0f - 5.0f, 10.0f, 10.0f, h - 20.0f} // centre line
    };
}

void GameScene::update()
{
    if (this->tutorial && this->tutorial->preempt())
        return;

    this->match.stepBodies();
    this->bot->control(this->match);
    this->match.settle();

    if (this->tutorial)
        this->tutorial->afterTick(this->match);
}

const RenderTexture2D &GameScene::draw()
{
    if (!this->ensureSurface())
        return this->surface;

    if (this->glyphs && !this->glyphs->isGenerated())
        this->glyphs->generate();

    BeginTextureMode(this->surface);
    ClearBackground(BLACK);

    // A waiting tutorial shows its dialogue on an otherwise empty frame.
    if (this->tutorial && this->tutorial->preempt())
        this->tutorial->drawDialog();
    else
        this->drawMatch();

    EndTextureMode();
    return this->surface;
}

void GameScene::drawMatch()
{
    for (const Rectangle &r : this->background)
        DrawRectangleRec(r, WALL_COLOR);

    const Paddle &player = this->match.getPlayer();
    const Paddle &botPad = this->match.getBot();
    DrawRectangleRec(player.rect(), player.isStunned() ? Color STUNNED_COLOR : WHITE);
    DrawRectangleRec(botPad.rect(), botPad.isStunned() ? Color STUNNED_COLOR : WHITE);
    DrawRectangleRec(this->match.getBall().rect(), WHITE);

    for (const Projectile &p : this->match.getProjectiles().getProjectiles())
        DrawRectangleRec(p.rect, GOLD);

    this->drawScores();
}

void GameScene::drawScores()
{
    int scale = this->glyphs ? this->glyphs->getScale() : GLYPH_SCALE;
    ScoreLayout layout = this->match.getScoreBoard().layout(this->sceneSettings.size.x / 2.0f, scale);
    if (!this->verifyScoreLayout(layout) || !this->glyphs)
        return;

    const ScoreBoard &sb = this->match.getScoreBoard();
    this->glyphs->drawText(std::to_string(sb.getPlayerScore()), {layout.playerStartX, SCORE_Y}, WHITE);
    this->glyphs->drawText(std::to_string(sb.getBotScore()), {layout.botStartX, SCORE_Y}, WHITE);
}

bool GameScene::verifyScoreLayout(const ScoreLayout &layout)
{
    if (!layout.isMirrored(this->sceneSettings.size.x / 2.0f))
        return true;
    this->manager.abort("both score displays are on the wrong side of the centre line");
    return false;
}

void GameScene::handleInput(int key)
{
    bool moveUp = (key == KEY_W || key == KEY_UP);
    bool moveDown = (key == KEY_S || key == KEY_DOWN);

    if (this->tutorial && this->tutorial->preempt())
    {
        if (moveUp || moveDown)
            this->tutorial->handleMove(this->match);
        return;
    }

    if (moveUp)
        this->match.getPlayer().control(PaddleMove::Up);
    else if (moveDown)
        this->match.getPlayer().control(PaddleMove::Down);
    else if (key == KEY_SPACE && this->tutorial)
        this->tutorial->shoot(this->match);
}

void GameScene::handleEvent(const InputEvent &event)
{
    if (event.type == InputEvent::Type::KeyPressed && event.key == KEY_ESCAPE)
    {
        this->returnToMenu();
        return;
    }

    if (!this->tutorial)
        return;

    this->tutorial->handleEvent(event, this->match);
    if (this->tutorial->isCloseRequested())
        this->manager.requestClose();
}

void GameScene::returnToMenu()
{
    if (this->tutorial)
    {
        this->tutorial->onReturnToMenu(this->match);
        this->bot->reset();
    }
    this->manager.setActive(SceneId::Menu);
}
