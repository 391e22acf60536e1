#include "arena.hpp"

Arena::Arena()
    : Arena({ARENA_X, ARENA_Y, ARENA_WIDTH, ARENA_HEIGHT},
            DESPAWN_MARGIN,
            {SCREEN_WIDTH / 2.0f, SCREEN_HEIGHT / 2.0f})
{
}

Arena::Arena(Rectangle playable, float margin, Vector2 spawnPoint)
    : bounds(playable), despawn(DespawnBound(playable, margin)), center(spawnPoint)
{
}

bool RectContains(const Rectangle &outer, const Rectangle &inner)
{
    return inner.x >= outer.x &&
           inner.y >= outer.y &&
           inner.x + inner.width <= outer.x + outer.width &&
           inner.y + inner.height <= outer.y + outer.height;
}

Vector2 RectCenter(const Rectangle &r)
{
    return {r.x + r.width * 0.5f, r.y + r.height * 0.5f};
}

Rectangle DespawnBound(const Rectangle &r, float margin)
{
    return {r.x - margin, r.y - margin, r.width + margin, r.height + margin};
}
