#pragma once
#include <raylib.h>
#include "constant.hpp"

/**
 * @brief Fixed rectangles describing where the match is played.
 *
 * `bounds` is the playable area paddles and ball are kept in. `despawn`
 * starts `DESPAWN_MARGIN` further left and up but keeps its right and bottom
 * edges on those of `bounds`; a ball whose hitbox is not fully inside it is
 * out of play and gets respawned. This also catches a ball the wall clamp
 * pushed past the right or bottom wall.
 *
 * `center` is the screen centre, not the centre of `bounds`. A new ball takes
 * it as its top-left corner.
 */
struct Arena
{
    Rectangle bounds;
    Rectangle despawn;
    Vector2 center;

    Arena();
    Arena(Rectangle playable, float margin, Vector2 spawnPoint);
};

// True when `inner` lies completely inside `outer` (shared edges allowed).
bool RectContains(const Rectangle &outer, const Rectangle &inner);
Vector2 RectCenter(const Rectangle &r);
// `r` moved up-left by `margin` with its right and bottom edges in place.
Rectangle DespawnBound(const Rectangle &r, float margin);
