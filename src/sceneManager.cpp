#include "sceneManager.hpp"
#include <utility>

const char *SceneName(SceneId id)
{
    switch (id)
    {
    case SceneId::Menu: return "menu";
    case SceneId::Game: return "game";
    case SceneId::Tutorial: return "tutorial";
    }
    return "unknown";
}

void SceneManager::registerScene(SceneId id, std::shared_ptr<Scene> scene)
{
    this->scenes[(size_t)id] = std::move(scene);
}

void SceneManager::setActive(SceneId id)
{
    if (id != this->activeId)
        TraceLog(LOG_INFO, "SCENE: %s -> %s", SceneName(this->activeId), SceneName(id));
    this->activeId = id;

    Scene *scene = this->getActive();
    if (!scene)
    {
        TraceLog(LOG_WARNING, "SCENE: no scene registered for %s", SceneName(id));
        return;
    }
    if (this->running && !scene->isInitialized())
        scene->initialize();
}

Scene *SceneManager::getActive() const
{
    return this->scenes[(size_t)this->activeId].get();
}

std::shared_ptr<Scene> SceneManager::getScene(SceneId id) const
{
    return this->scenes[(size_t)id];
}

void SceneManager::start()
{
    this->running = true;
    this->setActive(this->activeId);
}

void SceneManager::update()
{
    Scene *scene = this->getActive();
    if (scene && !this->done)
        scene->update();
}

void SceneManager::requestClose()
{
    if (!this->done)
        TraceLog(LOG_INFO, "APP: close requested");
    this->done = true;
}

void SceneManager::abort(const char *reason)
{
    TraceLog(LOG_ERROR, "APP: aborting run loop: %s", reason);
    this->done = true;
    this->exitCode = 1;
}
