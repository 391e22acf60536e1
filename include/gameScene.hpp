#pragma once
#include <memory>
#include <vector>
#include "scene.hpp"
#include "match.hpp"
#include "botPolicy.hpp"
#include "tutorialOverlay.hpp"

class SceneManager;
class GlyphSheet;

enum class GameMode
{
    Free,
    Tutorial,
};

/**
 * @brief Scene running a match against the bot.
 *
 * The free game uses BasicBotPolicy. The tutorial variant is the same scene
 * composed with a TutorialOverlay and a TutorialBotPolicy; the overlay
 * short-circuits `update()` and `draw()` while its dialogue waits for input.
 *
 * Controls: W/S or UP/DOWN move, SPACE shoots (tutorial shooting probe) and
 * confirms dialogue, ESC returns to the menu.
 */
class GameScene : public Scene
{
private:
    SceneManager &manager;
    GameMode mode;
    Match match;
    std::unique_ptr<TutorialOverlay> tutorial;
    std::unique_ptr<BotPolicy> bot;
    std::shared_ptr<GlyphSheet> glyphs;
    std::vector<Rectangle> background;

    void drawMatch();
    void drawScores();

public:
    GameScene(SceneManager &mgr, GameMode gameMode, std::shared_ptr<GlyphSheet> glyphSheet);
    ~GameScene() override = default;

    void update() override;
    const RenderTexture2D &draw() override;
    void handleInput(int key) override;
    void handleEvent(const InputEvent &event) override;

    /**
     * @brief Leave for the menu. The tutorial resets its match first.
     */
    void returnToMenu();

    /**
     * @brief Sanity check of the score display placement.
     *
     * Both displays on the wrong side of the centre line is fatal: the run
     * loop is aborted.
     *
     * @return false when the layout was rejected.
     */
    bool verifyScoreLayout(const ScoreLayout &layout);

    GameMode getMode() const { return this->mode; }
    Match &getMatch() { return this->match; }
    const Match &getMatch() const { return this->match; }
    TutorialOverlay *getTutorial() { return this->tutorial.get(); }
    BotPolicy &getBot() { return *this->bot; }
};
