#pragma once
#include <raylib.h>
#include <memory>
#include <vector>
#include "arena.hpp"
#include "paddle.hpp"
#include "ball.hpp"
#include "goal.hpp"
#include "scoreBoard.hpp"
#include "projectile.hpp"

/**
 * @brief Simulation state of one match: arena, both paddles, the ball, goals,
 * scores and projectiles.
 *
 * A tick is split in two so the bot can decide in between:
 *   1. `stepBodies()`  paddles, ball (walls, paddles, goals), projectiles
 *   2. bot control      (done by the owning scene through a BotPolicy)
 *   3. `settle()`      scoring cooldown, then respawn of an out-of-play ball
 *
 * Goals call back into the ScoreBoard member, so a Match is neither copyable
 * nor movable.
 */
class Match
{
private:
    Arena arena;
    Paddle player;
    Paddle bot;
    std::unique_ptr<Ball> ball;
    ScoreBoard scoreBoard;
    std::vector<Goal> goals;
    ProjectileManager projectiles;
    int respawnCount = 0;

public:
    Match();
    explicit Match(const Arena &a);

    Match(const Match &) = delete;
    Match &operator=(const Match &) = delete;
    Match(Match &&) = delete;
    Match &operator=(Match &&) = delete;

    void stepBodies();

    /**
     * @brief End-of-tick bookkeeping.
     * @return true when the ball was respawned.
     */
    bool settle();

    // Respawn when the ball hitbox left the despawn bound.
    bool respawnIfOut();

    /**
     * @brief Replace the ball with a new one whose top-left is the screen centre.
     *
     * Without an explicit velocity, one is sampled (see SampleSpawnVelocity).
     */
    void respawnBall();
    void respawnBall(Vector2 velocity);

    /**
     * @brief Turn a raw candidate into a spawn velocity.
     *
     * A candidate with nonzero length and nonzero x is rescaled to
     * `BALL_SPEED`; anything else becomes the fixed fallback (8, 9).
     */
    static Vector2 SpawnVelocity(Vector2 candidate);

    // Candidate drawn from two independent samples in [-10, 10).
    static Vector2 SampleSpawnVelocity();

    /**
     * @brief Scores to 0:0, new ball, no projectiles, default paddle tuning.
     */
    void reset();

    const Arena &getArena() const { return this->arena; }
    Paddle &getPlayer() { return this->player; }
    const Paddle &getPlayer() const { return this->player; }
    Paddle &getBot() { return this->bot; }
    const Paddle &getBot() const { return this->bot; }
    Ball &getBall() { return *this->ball; }
    const Ball &getBall() const { return *this->ball; }
    ScoreBoard &getScoreBoard() { return this->scoreBoard; }
    const ScoreBoard &getScoreBoard() const { return this->scoreBoard; }
    const std::vector<Goal> &getGoals() const { return this->goals; }
    ProjectileManager &getProjectiles() { return this->projectiles; }
    const ProjectileManager &getProjectiles() const { return this->projectiles; }
    int getRespawnCount() const { return this->respawnCount; }
};
