#include "scene.hpp"
#include <algorithm>

bool SceneSettings::accepts(InputEvent::Type type) const
{
    if (this->eventsFilter.empty())
        return true;
    return std::find(this->eventsFilter.begin(), this->eventsFilter.end(), type) != this->eventsFilter.end();
}

Scene::~Scene()
{
    this->unload();
}

bool Scene::ensureSurface()
{
    if (this->surface.id != 0)
        return true;
    if (!IsWindowReady())
        return false;

    RenderTexture2D tex = LoadRenderTexture((int)this->sceneSettings.size.x, (int)this->sceneSettings.size.y);
    if (tex.id == 0)
    {
        TraceLog(LOG_ERROR, "SCENE: could not create a %dx%d surface for '%s'",
                 (int)this->sceneSettings.size.x, (int)this->sceneSettings.size.y,
                 this->sceneSettings.title.c_str());
        return false;
    }

    SetTextureFilter(tex.texture, TEXTURE_FILTER_POINT);
    this->surface = tex;
    return true;
}

void Scene::initialize()
{
    if (this->initialized)
        return;
    this->onInitialize();
    this->initialized = true;
    TraceLog(LOG_INFO, "SCENE: '%s' initialized", this->sceneSettings.title.c_str());
}

void Scene::unload()
{
    // Unload only while the context is alive
    if (this->surface.id != 0)
    {
        if (IsWindowReady())
            UnloadRenderTexture(this->surface);
        this->surface = {};
    }
}
