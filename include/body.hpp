#pragma once
#include <raylib.h>

/**
 * @brief Base class for the moving 2D bodies of a match (paddles, ball).
 *
 * Stores the kinematic state (`position`, `velocity`), the hitbox described
 * as an offset and size relative to `position`, and the `walls` rectangle the
 * body is confined to. The hitbox is what collisions use; it may differ from
 * the visual size.
 */
class Body
{
protected:
    Vector2 position;     // Top-left of the body in logical screen units
    Vector2 velocity;     // Displacement applied per tick
    Vector2 hitboxOffset; // Hitbox top-left relative to position
    Vector2 hitboxSize;
    Vector2 size;         // Visual size
    Rectangle walls;      // Confining rectangle

public:
    Body(Vector2 pos, Vector2 vel, Rectangle hitbox, Vector2 visualSize, Rectangle bounds)
        : position(pos), velocity(vel), hitboxOffset{hitbox.x, hitbox.y},
          hitboxSize{hitbox.width, hitbox.height}, size(visualSize), walls(bounds) {}
    virtual ~Body() = default;

    /**
     * @brief Collision rectangle in world coordinates.
     */
    Rectangle hitbox() const
    {
        return {this->position.x + this->hitboxOffset.x, this->position.y + this->hitboxOffset.y,
                this->hitboxSize.x, this->hitboxSize.y};
    }

    // Visual rectangle used for drawing
    Rectangle rect() const { return {this->position.x, this->position.y, this->size.x, this->size.y}; }

    Vector2 hitboxCenter() const
    {
        Rectangle h = this->hitbox();
        return {h.x + h.width * 0.5f, h.y + h.height * 0.5f};
    }

    const Vector2 &pos() const { return this->position; }
    const Vector2 &vel() const { return this->velocity; }
    void setPosition(const Vector2 &newPos) { this->position = newPos; }
    void setVelocity(const Vector2 &newVel) { this->velocity = newVel; }
};
