#pragma once
#include <raylib.h>
#include <functional>
#include <utility>

/**
 * @brief Trigger region that calls `onCollide` whenever a hitbox overlaps it.
 *
 * The goal does not remember anything between calls; gating repeated
 * triggers is the callback's job (see ScoreBoard).
 */
class Goal
{
private:
    Rectangle region;
    std::function<void()> onCollide;

public:
    Goal(Rectangle rect, std::function<void()> callback) : region(rect), onCollide(std::move(callback)) {}

    // Returns true when `other` overlapped and the callback ran.
    bool collide(const Rectangle &other) const;
    const Rectangle &getRegion() const { return this->region; }
};
