#include "ball.hpp"
#include "paddle.hpp"
#include "goal.hpp"
#include <raymath.h>
#include <cmath>

Ball::Ball(Vector2 pos, Vector2 vel, Rectangle hitbox, Rectangle bounds,
           int bounceIntervalTicks, int padBounceIntervalTicks)
    : Body(pos, vel, hitbox, {hitbox.width, hitbox.height}, bounds),
      bounceInterval(bounceIntervalTicks),
      padsBounceInterval(padBounceIntervalTicks)
{
}

void Ball::update(const std::vector<Paddle *> &pads, const std::vector<Goal> &goals)
{
    this->position = Vector2Add(this->position, this->velocity);
    this->bounce();
    this->clampPos();

    if (this->bounceElapse > 0)
        this->bounceElapse--;

    if (this->padsBounceElapse > 0)
        this->padsBounceElapse--;

    this->bounceOffPaddles(pads);

    Rectangle h = this->hitbox();
    for (const Goal &goal : goals)
        goal.collide(h);
}

bool Ball::bounce()
{
    if (this->bounceElapse > 0)
        return false;

    bool bounced = false;
    // Edges are checked one after another against the updated hitbox, so a
    // corner reflects both axes in the same tick.
    if (this->hitbox().x < this->walls.x)
    {
        this->velocity = Vector2Multiply(this->velocity, horizontal);
        this->position = Vector2Add(this->position, this->velocity);
        this->bounceElapse = this->bounceInterval;
        bounced = true;
    }
    if (this->hitbox().x + this->hitboxSize.x > this->walls.x + this->walls.width)
    {
        this->velocity = Vector2Multiply(this->velocity, horizontal);
        this->position = Vector2Add(this->position, this->velocity);
        this->bounceElapse = this->bounceInterval;
        bounced = true;
    }
    if (this->hitbox().y < this->walls.y)
    {
        this->velocity = Vector2Multiply(this->velocity, vertical);
        this->position = Vector2Add(this->position, this->velocity);
        this->bounceElapse = this->bounceInterval;
        bounced = true;
    }
    if (this->hitbox().y + this->hitboxSize.y > this->walls.y + this->walls.height)
    {
        this->velocity = Vector2Multiply(this->velocity, vertical);
        this->position = Vector2Add(this->position, this->velocity);
        this->bounceElapse = this->bounceInterval;
        bounced = true;
    }
    return bounced;
}

void Ball::clampPos()
{
    // Offsets are tuned per edge and intentionally asymmetric.
    if (this->hitbox().x < this->walls.x)
        this->position.x = this->walls.x + BALL_LEFT_CLAMP_OFFSET;
    if (this->hitbox().x + this->hitboxSize.x > this->walls.x + this->walls.width)
        this->position.x = this->walls.x + this->walls.width + this->hitboxSize.x;
    if (this->hitbox().y < this->walls.y)
        this->position.y = this->walls.y + this->velocity.y;
    if (this->hitbox().y + this->hitboxSize.y > this->walls.y + this->walls.height)
        this->position.y = this->walls.y + this->walls.height + this->hitboxSize.y;
}

Paddle *Ball::bounceOffPaddles(const std::vector<Paddle *> &pads)
{
    if (this->padsBounceElapse > 0)
        return nullptr;

    Rectangle h = this->hitbox();
    for (Paddle *pad : pads)
    {
        if (!pad || !CheckCollisionRecs(h, pad->hitbox()))
            continue;

        this->velocity = PaddleBounceVelocity(this->velocity, pad->getBallBounce(),
                                              this->hitboxCenter(), pad->hitboxCenter());
        this->padsBounceElapse = this->padsBounceInterval;
        return pad;
    }
    return nullptr;
}

Vector2 Ball::PaddleBounceVelocity(Vector2 vel, Vector2 mask, Vector2 ballCenter, Vector2 padCenter)
{
    Vector2 sign = Vector2Multiply(vel, mask);
    Vector2 diff = Vector2Subtract(ballCenter, padCenter);
    float length = Vector2Length(diff);

    Vector2 dir;
    if (length > 0.0f)
        dir = Vector2Scale(diff, 1.0f / length);
    else
        dir = Vector2Normalize({PAD_FALLBACK_DIR_X, PAD_FALLBACK_DIR_Y});

    Vector2 v = Vector2Scale(dir, BALL_SPEED);
    if (v.x == 0.0f)
        v.x = 1.0f;

    return {std::copysign(v.x, sign.x), std::copysign(v.y, sign.y)};
}
