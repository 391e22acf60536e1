#pragma once
#include <raylib.h>
#include <vector>
#include "body.hpp"
#include "constant.hpp"

class Paddle;
class Goal;

/**
 * @brief The ball: moves at constant velocity, bounces off walls and paddles,
 * and triggers goals.
 *
 * Two cooldowns keep a collision from firing again on the following ticks:
 * `bounceElapse` for the walls and `padsBounceElapse` for the paddles. A
 * paddle pinned against a wall would otherwise flip the velocity every tick.
 */
class Ball : public Body
{
private:
    int bounceInterval;
    int bounceElapse = 0;
    int padsBounceInterval;
    int padsBounceElapse = 0;

    static constexpr Vector2 horizontal{-1.0f, 1.0f};
    static constexpr Vector2 vertical{1.0f, -1.0f};

public:
    Ball(Vector2 pos, Vector2 vel, Rectangle hitbox, Rectangle bounds,
         int bounceIntervalTicks, int padBounceIntervalTicks);

    /**
     * @brief Advance one tick.
     *
     * Order: integrate, wall bounce, clamp, cooldown countdown, paddle bounce
     * (first overlapping paddle only), then every overlapping goal fires.
     *
     * @param pads Paddles in collision priority order.
     * @param goals Goals tested against the final hitbox.
     */
    void update(const std::vector<Paddle *> &pads, const std::vector<Goal> &goals);

    /**
     * @brief Reflect off every wall edge the hitbox crosses.
     *
     * Does nothing while the wall cooldown runs. Each crossed edge negates the
     * matching velocity component and steps the ball once more.
     *
     * @return true when at least one edge reflected.
     */
    bool bounce();

    // Push the ball away from crossed edges by fixed, per-edge offsets.
    void clampPos();

    /**
     * @brief Take the new velocity from the first overlapping paddle.
     * @return The paddle that was hit, or nullptr.
     */
    Paddle *bounceOffPaddles(const std::vector<Paddle *> &pads);

    /**
     * @brief Velocity after hitting a paddle.
     *
     * Direction comes from the paddle centre towards the ball centre, scaled to
     * `BALL_SPEED`; the polarity per axis is taken from `vel * mask`.
     */
    static Vector2 PaddleBounceVelocity(Vector2 vel, Vector2 mask, Vector2 ballCenter, Vector2 padCenter);

    int getBounceElapse() const { return this->bounceElapse; }
    int getPadsBounceElapse() const { return this->padsBounceElapse; }
    int getBounceInterval() const { return this->bounceInterval; }
    int getPadsBounceInterval() const { return this->padsBounceInterval; }
};
