#include "match.hpp"
#include <raymath.h>

namespace
{
Rectangle paddleHitbox()
{
    return {0.0f, 0.0f, PADDLE_WIDTH, PADDLE_HEIGHT};
}

Rectangle ballHitbox()
{
    return {0.0f, 0.0f, BALL_SIZE, BALL_SIZE};
}
}

Match::Match() : Match(Arena())
{
}

Match::Match(const Arena &a)
    : arena(a),
      player({PLAYER_START_X, PADDLE_START_Y}, paddleHitbox(), a.bounds, PADDLE_CONTROL_DELAY),
      bot({BOT_START_X, PADDLE_START_Y}, paddleHitbox(), a.bounds, PADDLE_CONTROL_DELAY)
{
    this->goals.emplace_back(Rectangle{LEFT_GOAL_X, 0.0f, GOAL_WIDTH, (float)SCREEN_HEIGHT},
                             [this]() { this->scoreBoard.leftCollide(); });
    this->goals.emplace_back(Rectangle{RIGHT_GOAL_X, 0.0f, GOAL_WIDTH, (float)SCREEN_HEIGHT},
                             [this]() { this->scoreBoard.rightCollide(); });
    this->respawnBall();
}

void Match::stepBodies()
{
    this->player.update();
    this->bot.update();

    std::vector<Paddle *> pads = {&this->player, &this->bot};
    this->ball->update(pads, this->goals);

    this->projectiles.update(this->arena.despawn);
}

bool Match::settle()
{
    this->scoreBoard.update();
    return this->respawnIfOut();
}

bool Match::respawnIfOut()
{
    if (RectContains(this->arena.despawn, this->ball->hitbox()))
        return false;
    this->respawnBall();
    return true;
}

void Match::respawnBall()
{
    this->respawnBall(SpawnVelocity(SampleSpawnVelocity()));
}

void Match::respawnBall(Vector2 velocity)
{
    // Old ball is destroyed here; nothing else holds on to it.
    this->ball = std::make_unique<Ball>(this->arena.center, velocity, ballHitbox(),
                                        this->arena.bounds, BALL_BOUNCE_INTERVAL,
                                        BALL_PAD_BOUNCE_INTERVAL);
    this->respawnCount++;
    TraceLog(LOG_DEBUG, "BALL: respawned with velocity (%.2f, %.2f)", velocity.x, velocity.y);
}

Vector2 Match::SpawnVelocity(Vector2 candidate)
{
    float length = Vector2Length(candidate);
    if (length > 0.0f && candidate.x != 0.0f)
        return Vector2Scale(candidate, BALL_SPEED / length);
    return {BALL_FALLBACK_VEL_X, BALL_FALLBACK_VEL_Y};
}

Vector2 Match::SampleSpawnVelocity()
{
    // GetRandomValue is inclusive on both ends, so the upper bound stops one step short.
    const int steps = 1000;
    int range = (int)(BALL_SPAWN_RANGE * steps);
    float x = (float)GetRandomValue(-range, range - 1) / (float)steps;
    float y = (float)GetRandomValue(-range, range - 1) / (float)steps;
    return {x, y};
}

void Match::reset()
{
    this->scoreBoard.reset();
    this->projectiles.clear();
    this->player.setTuning(PaddleTuning{});
    this->bot.setTuning(PaddleTuning{});
    this->respawnBall();
}
