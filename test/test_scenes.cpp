#include "testing.hpp"
#include "gameScene.hpp"
#include "glyphSheet.hpp"
#include "menuScene.hpp"
#include "sceneManager.hpp"
#include <memory>

namespace
{
class CountingScene : public Scene
{
public:
    int inits = 0;
    int updates = 0;

    void onInitialize() override { this->inits++; }
    void update() override { this->updates++; }
    const RenderTexture2D &draw() override { return this->surface; }
};

InputEvent keyPressed(int key)
{
    InputEvent e{InputEvent::Type::KeyPressed};
    e.key = key;
    return e;
}

InputEvent mouseEvent(InputEvent::Type type, Rectangle target)
{
    InputEvent e{type};
    e.button = MOUSE_BUTTON_LEFT;
    e.position = {target.x + target.width / 2.0f, target.y + target.height / 2.0f};
    return e;
}
} // namespace

bool test_scene_initialized_once()
{
    SceneManager mgr;
    auto menu = std::make_shared<CountingScene>();
    auto game = std::make_shared<CountingScene>();
    mgr.registerScene(SceneId::Menu, menu);
    mgr.registerScene(SceneId::Game, game);

    // Nothing is initialized before the loop starts.
    mgr.setActive(SceneId::Game);
    EXPECT(game->inits == 0);

    mgr.start();
    EXPECT(mgr.isRunning());
    EXPECT(game->inits == 1);
    EXPECT(menu->inits == 0);

    mgr.setActive(SceneId::Menu);
    mgr.setActive(SceneId::Game);
    mgr.setActive(SceneId::Menu);
    EXPECT(menu->inits == 1);
    EXPECT(game->inits == 1);
    EXPECT(mgr.getActive() == menu.get());

    mgr.update();
    EXPECT(menu->updates == 1);
    EXPECT(game->updates == 0);

    mgr.requestClose();
    EXPECT(mgr.isDone());
    EXPECT(mgr.getExitCode() == 0);
    mgr.update();
    EXPECT(menu->updates == 1);
    return true;
}

bool test_scene_manager_abort()
{
    SceneManager mgr;
    mgr.registerScene(SceneId::Menu, std::make_shared<CountingScene>());
    mgr.start();
    mgr.abort("test");
    EXPECT(mgr.isDone());
    EXPECT(mgr.getExitCode() == 1);

    SceneSettings s;
    EXPECT(s.accepts(InputEvent::Type::MouseMoved));
    s.eventsFilter = {InputEvent::Type::KeyPressed};
    EXPECT(s.accepts(InputEvent::Type::KeyPressed));
    EXPECT(!s.accepts(InputEvent::Type::MouseMoved));
    return true;
}

bool test_tutorial_scene_pauses_match()
{
    SceneManager mgr;
    auto scene = std::make_shared<GameScene>(mgr, GameMode::Tutorial, nullptr);
    mgr.registerScene(SceneId::Tutorial, scene);
    mgr.setActive(SceneId::Tutorial);
    mgr.start();

    TutorialOverlay *tutorial = scene->getTutorial();
    EXPECT(tutorial != nullptr);
    EXPECT(tutorial->preempt());

    Vector2 start = scene->getMatch().getBall().pos();
    scene->update();
    EXPECT_NEAR(scene->getMatch().getBall().pos().x, start.x);
    EXPECT_NEAR(scene->getMatch().getBall().pos().y, start.y);

    scene->handleEvent(keyPressed(KEY_SPACE));
    EXPECT(tutorial->getStateMachine().getStage() == TutorialStage::MoveHint);
    scene->handleEvent(keyPressed(KEY_ENTER));
    EXPECT(tutorial->getStateMachine().getStage() == TutorialStage::MoveHint);

    // Moving confirms the hint but does not move the paddle yet.
    scene->handleInput(KEY_W);
    EXPECT(tutorial->getStateMachine().getStage() == TutorialStage::DifficultyProbe);
    EXPECT_NEAR(scene->getMatch().getPlayer().vel().y, 0.0f);

    scene->update();
    Vector2 moved = scene->getMatch().getBall().pos();
    EXPECT(moved.x != start.x || moved.y != start.y);

    scene->handleInput(KEY_S);
    EXPECT_NEAR(scene->getMatch().getPlayer().vel().y, PADDLE_IMPULSE);

    // No shots outside the shooting probe.
    scene->handleInput(KEY_SPACE);
    EXPECT(scene->getMatch().getProjectiles().getProjectiles().empty());
    return true;
}

bool test_game_scene_escape_to_menu()
{
    SceneManager mgr;
    auto menu = std::make_shared<MenuScene>(mgr, nullptr);
    auto game = std::make_shared<GameScene>(mgr, GameMode::Free, nullptr);
    auto tutorial = std::make_shared<GameScene>(mgr, GameMode::Tutorial, nullptr);
    mgr.registerScene(SceneId::Menu, menu);
    mgr.registerScene(SceneId::Game, game);
    mgr.registerScene(SceneId::Tutorial, tutorial);
    mgr.start();

    EXPECT(game->getTutorial() == nullptr);
    mgr.setActive(SceneId::Game);
    game->getMatch().getScoreBoard().setScores(2, 1);
    game->handleEvent(keyPressed(KEY_ESCAPE));
    EXPECT(mgr.getActiveId() == SceneId::Menu);
    EXPECT(game->getMatch().getScoreBoard().getPlayerScore() == 2);

    // The tutorial starts over from 0:0 and the default bot.
    mgr.setActive(SceneId::Tutorial);
    tutorial->getMatch().getScoreBoard().setScores(3, 4);
    tutorial->getMatch().getBot().setTuning({5.0f, 20});
    tutorial->handleEvent(keyPressed(KEY_ESCAPE));
    EXPECT(mgr.getActiveId() == SceneId::Menu);
    EXPECT(tutorial->getMatch().getScoreBoard().getPlayerScore() == 0);
    EXPECT(tutorial->getMatch().getScoreBoard().getBotScore() == 0);
    EXPECT(tutorial->getMatch().getBot().getTuning().controlDelay == PADDLE_CONTROL_DELAY);
    EXPECT(!mgr.isDone());
    return true;
}

bool test_mirrored_scores_abort()
{
    SceneManager mgr;
    auto game = std::make_shared<GameScene>(mgr, GameMode::Free, nullptr);
    mgr.registerScene(SceneId::Game, game);
    mgr.setActive(SceneId::Game);
    mgr.start();

    float center = game->settings().size.x / 2.0f;
    EXPECT(game->verifyScoreLayout(game->getMatch().getScoreBoard().layout(center, GLYPH_SCALE)));
    EXPECT(!mgr.isDone());

    ScoreLayout swapped;
    swapped.playerStartX = center + 10.0f;
    swapped.playerWidth = 24.0f;
    swapped.botStartX = center - 40.0f;
    EXPECT(!game->verifyScoreLayout(swapped));
    EXPECT(mgr.isDone());
    EXPECT(mgr.getExitCode() == 1);
    return true;
}

bool test_tutorial_closing_requests_close()
{
    SceneManager mgr;
    auto scene = std::make_shared<GameScene>(mgr, GameMode::Tutorial, nullptr);
    mgr.registerScene(SceneId::Tutorial, scene);
    mgr.setActive(SceneId::Tutorial);
    mgr.start();

    TutorialStateMachine &sm = scene->getTutorial()->getStateMachine();
    sm.setStage(TutorialStage::Closing, scene->getMatch().getScoreBoard());
    scene->handleEvent(keyPressed(KEY_SPACE));
    EXPECT(sm.isCloseRequested());
    EXPECT(mgr.isDone());
    EXPECT(mgr.getExitCode() == 0);
    return true;
}

bool test_menu_navigation()
{
    SceneManager mgr;
    auto menu = std::make_shared<MenuScene>(mgr, nullptr);
    auto tutorial = std::make_shared<GameScene>(mgr, GameMode::Tutorial, nullptr);
    mgr.registerScene(SceneId::Menu, menu);
    mgr.registerScene(SceneId::Tutorial, tutorial);

    EXPECT(menu->getButtons().empty());
    mgr.start();
    EXPECT(menu->getButtons().size() == 3);
    EXPECT(menu->getSelected() == 0);

    menu->handleEvent(keyPressed(KEY_UP));
    EXPECT(menu->getSelected() == 2);
    menu->handleEvent(keyPressed(KEY_DOWN));
    menu->handleEvent(keyPressed(KEY_DOWN));
    EXPECT(menu->getSelected() == 1);
    menu->handleEvent(keyPressed(KEY_ENTER));
    EXPECT(mgr.getActiveId() == SceneId::Tutorial);
    EXPECT(tutorial->isInitialized());

    mgr.setActive(SceneId::Menu);
    Rectangle play = menu->getButtons()[0].bounds;
    menu->handleEvent(mouseEvent(InputEvent::Type::MouseMoved, play));
    EXPECT(menu->getSelected() == 0);

    Rectangle quit = menu->getButtons()[2].bounds;
    menu->handleEvent(mouseEvent(InputEvent::Type::MouseButtonPressed, quit));
    EXPECT(mgr.isDone());
    EXPECT(mgr.getExitCode() == 0);
    return true;
}

bool test_glyph_lookup()
{
    GlyphSheet glyphs("no_such_sheet.png", GLYPH_SCALE);
    Rectangle r{};
    EXPECT(!glyphs.get('A', r));

    // Without a window only the lookup table is built.
    EXPECT(!glyphs.generate());
    EXPECT(glyphs.isGenerated());
    EXPECT(glyphs.get('a', r));
    EXPECT_NEAR(r.x, 40.0f);
    EXPECT_NEAR(r.y, 0.0f);
    EXPECT_NEAR(r.width, 4.0f);
    EXPECT_NEAR(r.height, 6.0f);
    EXPECT(glyphs.get('7', r));
    EXPECT_NEAR(r.x, 28.0f);
    EXPECT(!glyphs.get('~', r));
    EXPECT_NEAR(glyphs.getAdvance(), GLYPH_SCALE * 5.0f);
    return true;
}
