#pragma once
#include <array>
#include <memory>
#include "scene.hpp"

enum class SceneId
{
    Menu,
    Game,
    Tutorial,
};

const char *SceneName(SceneId id);

/**
 * @brief Owns the three scenes and tracks which one is active.
 *
 * Switching scenes while the loop runs initializes the new scene once.
 * Scenes that were already initialized are re-entered as they are, including
 * the layout computed at initialization. The `done` flag ends the loop;
 * `abort()` additionally marks the run as failed.
 */
class SceneManager
{
private:
    std::array<std::shared_ptr<Scene>, 3> scenes;
    SceneId activeId = SceneId::Menu;
    bool running = false;
    bool done = false;
    int exitCode = 0;

public:
    void registerScene(SceneId id, std::shared_ptr<Scene> scene);

    /**
     * @brief Make `id` the active scene.
     *
     * Initializes it when the loop is running and it never was.
     */
    void setActive(SceneId id);
    SceneId getActiveId() const { return this->activeId; }
    Scene *getActive() const;
    std::shared_ptr<Scene> getScene(SceneId id) const;

    /**
     * @brief Mark the loop as running and initialize the active scene.
     */
    void start();
    bool isRunning() const { return this->running; }

    // Route one tick to the active scene.
    void update();

    void requestClose();
    /**
     * @brief Stop the loop after an invariant violation.
     */
    void abort(const char *reason);
    bool isDone() const { return this->done; }
    int getExitCode() const { return this->exitCode; }
};
