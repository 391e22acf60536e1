#include "app.hpp"
#include "gameScene.hpp"
#include "glyphSheet.hpp"
#include "menuScene.hpp"
#include "raymath.h"
#include <ctime>

namespace
{
// Keys whose held state is forwarded to the active scene every tick.
const int heldKeys[] = {KEY_W, KEY_S, KEY_UP, KEY_DOWN, KEY_SPACE, KEY_ENTER, KEY_ESCAPE};
const int heldButtons[] = {MOUSE_BUTTON_LEFT, MOUSE_BUTTON_RIGHT, MOUSE_BUTTON_MIDDLE};
} // namespace

App::App(const AppConfig &cfg) : config(cfg)
{
    this->glyphs = std::make_shared<GlyphSheet>(this->config.glyphSheet.c_str(), GLYPH_SCALE);
    this->buildScenes();
}

void App::buildScenes()
{
    Vector2 scale{(float)(SCREEN_WIDTH * this->config.windowScale), (float)(SCREEN_HEIGHT * this->config.windowScale)};

    auto menu = std::make_shared<MenuScene>(this->manager, this->glyphs);
    auto game = std::make_shared<GameScene>(this->manager, GameMode::Free, this->glyphs);
    auto tutorial = std::make_shared<GameScene>(this->manager, GameMode::Tutorial, this->glyphs);
    menu->setScale(scale);
    game->setScale(scale);
    tutorial->setScale(scale);

    this->manager.registerScene(SceneId::Menu, menu);
    this->manager.registerScene(SceneId::Game, game);
    this->manager.registerScene(SceneId::Tutorial, tutorial);
}

bool App::initWindow()
{
    const SceneSettings &s = this->manager.getActive()->settings();
    InitWindow((int)s.scale.x, (int)s.scale.y, s.title.c_str());
    if (!IsWindowReady())
    {
        TraceLog(LOG_ERROR, "APP: window could not be created");
        return false;
    }
    SetExitKey(KEY_NULL); // ESC is handled by the scenes
    SetTargetFPS(this->config.targetFps);

    unsigned int seed = this->config.randomSeed ? this->config.randomSeed : (unsigned int)std::time(nullptr);
    SetRandomSeed(seed);
    TraceLog(LOG_INFO, "APP: random seed %u", seed);
    return true;
}

void App::initAudio()
{
    InitAudioDevice();
    if (!IsAudioDeviceReady())
    {
        TraceLog(LOG_WARNING, "AUDIO: no audio device, running silent");
        return;
    }
    if (!FileExists(this->config.musicFile.c_str()))
    {
        TraceLog(LOG_WARNING, "AUDIO: %s not found, running silent", this->config.musicFile.c_str());
        return;
    }

    this->music = LoadMusicStream(this->config.musicFile.c_str());
    if (this->music.frameCount == 0)
    {
        TraceLog(LOG_WARNING, "AUDIO: could not decode %s", this->config.musicFile.c_str());
        return;
    }
    this->music.looping = true;
    SetMusicVolume(this->music, this->config.musicVolume);
    PlayMusicStream(this->music);
    this->musicLoaded = true;
}

int App::run()
{
    if (!this->initWindow())
        return 1;
    this->initAudio();
    this->manager.start();
    this->titleScene = this->manager.getActiveId();
    this->lastMouse = GetMousePosition();

    while (!this->manager.isDone())
    {
        if (this->musicLoaded)
            UpdateMusicStream(this->music);

        this->manager.update();

        Scene *scene = this->manager.getActive();
        if (!scene)
            break;

        if (this->manager.getActiveId() != this->titleScene)
        {
            this->titleScene = this->manager.getActiveId();
            SetWindowTitle(scene->settings().title.c_str());
        }

        this->drawFrame(*scene);

        // A draw can abort the run; the event and input pass must see the
        // scene that is active now.
        scene = this->manager.getActive();
        if (this->manager.isDone() || !scene)
            break;
        this->handleEvents(*scene);

        scene = this->manager.getActive();
        if (this->manager.isDone() || !scene)
            break;
        this->handleInput(*scene);
    }

    TraceLog(LOG_INFO, "APP: shutting down (exit code %d)", this->manager.getExitCode());
    this->cleanup();
    return this->manager.getExitCode();
}

void App::drawFrame(Scene &scene)
{
    const RenderTexture2D &surface = scene.draw();

    BeginDrawing();
    ClearBackground(BLACK);
    if (surface.id != 0)
    {
        Rectangle src{0.0f, 0.0f, (float)surface.texture.width, -(float)surface.texture.height};
        Rectangle dst{0.0f, 0.0f, (float)GetScreenWidth(), (float)GetScreenHeight()};
        DrawTexturePro(surface.texture, src, dst, {0.0f, 0.0f}, 0.0f, WHITE);
    }
    if (this->config.showFps)
        DrawFPS(10, 10);
    EndDrawing();
}

Vector2 App::logicalMouse(const Scene &scene) const
{
    const SceneSettings &s = scene.settings();
    Vector2 ratio{s.size.x / (float)GetScreenWidth(), s.size.y / (float)GetScreenHeight()};
    return Vector2Multiply(GetMousePosition(), ratio);
}

void App::handleEvents(Scene &scene)
{
    if (WindowShouldClose())
    {
        this->manager.requestClose();
        return;
    }

    const SceneSettings &s = scene.settings();
    std::vector<InputEvent> events;

    for (int key = GetKeyPressed(); key != 0; key = GetKeyPressed())
    {
        InputEvent e{InputEvent::Type::KeyPressed};
        e.key = key;
        events.push_back(e);
    }

    Vector2 mouse = GetMousePosition();
    Vector2 logical = this->logicalMouse(scene);
    if (mouse.x != this->lastMouse.x || mouse.y != this->lastMouse.y)
    {
        InputEvent e{InputEvent::Type::MouseMoved};
        e.position = logical;
        events.push_back(e);
        this->lastMouse = mouse;
    }

    for (int button : heldButtons)
    {
        if (!IsMouseButtonPressed(button))
            continue;
        InputEvent e{InputEvent::Type::MouseButtonPressed};
        e.button = button;
        e.position = logical;
        events.push_back(e);
    }

    for (const InputEvent &e : events)
    {
        if (!s.accepts(e.type))
            continue;
        scene.handleEvent(e);
        // Stop once the event moved us to another scene or ended the run.
        if (this->manager.getActive() != &scene || this->manager.isDone())
            break;
    }
}

void App::handleInput(Scene &scene)
{
    for (int key : heldKeys)
    {
        if (IsKeyDown(key))
            scene.handleInput(key);
    }

    Vector2 logical = this->logicalMouse(scene);
    for (int button : heldButtons)
    {
        if (IsMouseButtonDown(button))
            scene.handleMousePress(button, logical);
    }
}

void App::cleanup()
{
    for (SceneId id : {SceneId::Menu, SceneId::Game, SceneId::Tutorial})
    {
        std::shared_ptr<Scene> scene = this->manager.getScene(id);
        if (scene)
            scene->unload();
    }
    if (this->glyphs)
        this->glyphs->cleanup();

    if (this->musicLoaded)
    {
        StopMusicStream(this->music);
        UnloadMusicStream(this->music);
        this->musicLoaded = false;
    }
    if (IsAudioDeviceReady())
        CloseAudioDevice();
    CloseWindow();
}
