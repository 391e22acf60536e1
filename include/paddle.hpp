#pragma once
#include <raylib.h>
#include "body.hpp"
#include "constant.hpp"

enum class PaddleMove
{
    None,
    Up,
    Down
};

/**
 * @brief Strength of a paddle's control: impulse per accepted command and the
 * debounce delay in ticks between accepted commands.
 *
 * Swapped as a whole (`Paddle::setTuning`) when the tutorial changes the bot
 * difficulty.
 */
struct PaddleTuning
{
    float impulse = PADDLE_IMPULSE;
    int controlDelay = PADDLE_CONTROL_DELAY;
};

/**
 * @brief Vertically moving paddle with debounced impulse control.
 *
 * `control()` accepts at most one impulse every `controlDelay` ticks; commands
 * arriving earlier are only recorded in `moveBuffer`. `update()` integrates
 * the velocity with friction and clamps the hitbox inside the walls: paddles
 * stop at the walls, they never bounce.
 *
 * A stunned paddle (hit by a projectile) ignores control commands until the
 * stun timer runs out.
 */
class Paddle : public Body
{
private:
    PaddleTuning tuning;
    int lastPress = 0;                     // Ticks until the next command is accepted
    PaddleMove moveBuffer = PaddleMove::None; // Last command refused by the debounce
    Vector2 ballBounce{-1.0f, 1.0f};       // Sign mask applied to the ball velocity on a hit
    int stunTimer = 0;

public:
    Paddle(Vector2 pos, Rectangle hitbox, Rectangle bounds, int controlDelay);

    /**
     * @brief Advance one tick: integrate, apply friction, clamp, count down timers.
     */
    void update();

    void up();
    void down();

    /**
     * @brief Request a move. Applied immediately unless the debounce timer runs.
     */
    void control(PaddleMove mode);

    // Snap the position 1 unit inside any wall edge the hitbox crosses.
    void clampPos();

    void stun(int ticks);
    bool isStunned() const { return this->stunTimer > 0; }
    int getStunTime() const { return this->stunTimer; }

    const PaddleTuning &getTuning() const { return this->tuning; }
    void setTuning(const PaddleTuning &newTuning) { this->tuning = newTuning; }
    int getLastPress() const { return this->lastPress; }
    PaddleMove getMoveBuffer() const { return this->moveBuffer; }
    const Vector2 &getBallBounce() const { return this->ballBounce; }
};
