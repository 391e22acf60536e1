#pragma once
#include <raylib.h>
#include <memory>
#include <vector>
#include "appConfig.hpp"
#include "sceneManager.hpp"

class GlyphSheet;

/**
 * @brief Window, audio and the fixed-rate main loop around the SceneManager.
 *
 * One iteration: active scene update, draw (its surface stretched over the
 * window), discrete events, held input, then the frame limiter of
 * `SetTargetFPS`. Window close and scene requests end the loop.
 */
class App
{
private:
    AppConfig config;
    SceneManager manager;
    std::shared_ptr<GlyphSheet> glyphs;
    Music music{};
    bool musicLoaded = false;
    SceneId titleScene = SceneId::Menu;
    Vector2 lastMouse{0, 0};

    bool initWindow();
    void initAudio();
    void buildScenes();
    void drawFrame(Scene &scene);
    void handleEvents(Scene &scene);
    void handleInput(Scene &scene);
    Vector2 logicalMouse(const Scene &scene) const;
    void cleanup();

public:
    explicit App(const AppConfig &cfg);
    ~App() = default;

    App(const App &) = delete;
    App &operator=(const App &) = delete;

    /**
     * @brief Run until a scene or the window asks to close.
     * @return Process exit code, nonzero after an aborted run.
     */
    int run();

    Scene *getScene() const { return this->manager.getActive(); }
    void setScene(SceneId id) { this->manager.setActive(id); }
    SceneManager &getManager() { return this->manager; }
    bool isDone() const { return this->manager.isDone(); }
};
