#pragma once
#include <raylib.h>
#include <string>
#include <vector>
#include "constant.hpp"

/**
 * @brief Discrete input event collected by the application once per tick.
 */
struct InputEvent
{
    enum class Type
    {
        KeyPressed,
        MouseButtonPressed,
        MouseMoved,
    };

    Type type;
    int key = 0;            // KeyPressed
    int button = 0;         // MouseButtonPressed
    Vector2 position{0, 0}; // Logical cursor position for mouse events
};

/**
 * @brief Presentation settings of a scene.
 *
 * `size` is the logical surface size the scene draws at, `scale` the window
 * size it is stretched to. Only event types listed in `eventsFilter` are
 * routed to `handleEvent()`; an empty filter lets everything through.
 */
struct SceneSettings
{
    Vector2 size{(float)SCREEN_WIDTH, (float)SCREEN_HEIGHT};
    Vector2 scale{(float)SCREEN_WIDTH * 2.0f, (float)SCREEN_HEIGHT * 2.0f};
    std::string title = "Pong";
    std::vector<InputEvent::Type> eventsFilter;

    bool accepts(InputEvent::Type type) const;
};

/**
 * @brief Base class for Menu, Game and Tutorial scenes.
 *
 * Every tick the application calls `update()`, then `draw()`, then routes
 * events and held input. `draw()` returns the composed frame as an
 * off-screen surface of `settings().size`; the surface is created lazily on
 * first draw so scenes can be built and updated without a window.
 *
 * `initialize()` runs `onInitialize()` exactly once; the SceneManager calls
 * it the first time the scene becomes active while the loop is running.
 */
class Scene
{
protected:
    SceneSettings sceneSettings;
    RenderTexture2D surface{};
    bool initialized = false;

    virtual void onInitialize() {}

    // Create the surface if needed. Returns false without a graphics context.
    bool ensureSurface();

public:
    Scene() = default;
    virtual ~Scene();

    Scene(const Scene &) = delete;
    Scene &operator=(const Scene &) = delete;

    virtual void update() = 0;
    virtual const RenderTexture2D &draw() = 0;

    // Called for every polled key held down this tick.
    virtual void handleInput(int key) {}
    // Called for every mouse button held down this tick.
    virtual void handleMousePress(int button, Vector2 position) {}
    virtual void handleEvent(const InputEvent &event) {}

    void initialize();
    bool isInitialized() const { return this->initialized; }

    // Release GPU resources; safe to call more than once.
    virtual void unload();

    const SceneSettings &settings() const { return this->sceneSettings; }
    void setScale(Vector2 scale) { this->sceneSettings.scale = scale; }
};
