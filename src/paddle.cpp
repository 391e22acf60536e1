#include "paddle.hpp"
#include <raymath.h>

Paddle::Paddle(Vector2 pos, Rectangle hitbox, Rectangle bounds, int controlDelay)
    : Body(pos, {0.0f, 0.0f}, hitbox, {hitbox.width, hitbox.height}, bounds)
{
    this->tuning.controlDelay = controlDelay;
}

void Paddle::update()
{
    this->position = Vector2Add(this->position, this->velocity);
    this->velocity = Vector2Scale(this->velocity, PADDLE_FRICTION);

    this->clampPos();

    if (this->lastPress > 0)
        this->lastPress--;
    if (this->stunTimer > 0)
        this->stunTimer--;
}

void Paddle::up()
{
    this->velocity.y -= this->tuning.impulse;
}

void Paddle::down()
{
    this->velocity.y += this->tuning.impulse;
}

void Paddle::control(PaddleMove mode)
{
    if (this->isStunned())
        return;

    // The buffered move is recorded only, nothing replays it later.
    if (this->lastPress > 0)
    {
        this->moveBuffer = mode;
        return;
    }

    if (mode == PaddleMove::Up)
        this->up();
    else if (mode == PaddleMove::Down)
        this->down();
    else
        return;

    this->lastPress = this->tuning.controlDelay;
    this->moveBuffer = PaddleMove::None;
}

void Paddle::clampPos()
{
    Rectangle h = this->hitbox();
    if (h.x < this->walls.x)
        this->position.x = this->walls.x + PADDLE_CLAMP_EPSILON - this->hitboxOffset.x;
    if (h.x + h.width > this->walls.x + this->walls.width)
        this->position.x = this->walls.x + this->walls.width - h.width - PADDLE_CLAMP_EPSILON - this->hitboxOffset.x;
    if (h.y < this->walls.y)
        this->position.y = this->walls.y + PADDLE_CLAMP_EPSILON - this->hitboxOffset.y;
    if (h.y + h.height > this->walls.y + this->walls.height)
        this->position.y = this->walls.y + this->walls.height - h.height - PADDLE_CLAMP_EPSILON - this->hitboxOffset.y;
}

void Paddle::stun(int ticks)
{
    if (ticks > this->stunTimer)
        this->stunTimer = ticks;
}
