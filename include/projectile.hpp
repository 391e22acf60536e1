#pragma once
#include <raylib.h>
#include <vector>
#include "constant.hpp"

class Paddle;

/**
 * @brief Horizontal shot fired by a paddle.
 *
 * `target` is the paddle it can stun; the shooter's own paddle is never hit.
 */
struct Projectile
{
    Rectangle rect;
    float speed; // Signed horizontal displacement per tick
    Paddle *target;
};

/**
 * @brief Owns every live projectile of a match.
 *
 * Each tick moves all projectiles, drops those outside the despawn bound and
 * stuns the target paddle of any projectile that hits it (that projectile is
 * removed too).
 */
class ProjectileManager
{
private:
    std::vector<Projectile> projectiles;
    int stunTicks;

public:
    explicit ProjectileManager(int stunDuration = STUN_DURATION) : stunTicks(stunDuration) {}

    /**
     * @brief Spawn a projectile at the shooter's hitbox centre heading for `target`.
     */
    void fire(const Paddle &shooter, Paddle *target);

    /**
     * @brief Move, cull and resolve hits.
     * @return Number of paddles stunned this tick.
     */
    int update(const Rectangle &despawn);

    void clear() { this->projectiles.clear(); }
    const std::vector<Projectile> &getProjectiles() const { return this->projectiles; }
};

/**
 * @brief Reload timer gating how often a shooter may fire.
 */
class Launcher
{
private:
    int reload = 0;
    int reloadPeriod;

public:
    explicit Launcher(int period = RELOAD_PERIOD) : reloadPeriod(period) {}

    bool canShoot() const { return this->reload <= 0; }

    /**
     * @brief Fire if reloaded, then start the reload period.
     * @return true when a projectile was spawned.
     */
    bool tryFire(ProjectileManager &pm, const Paddle &shooter, Paddle *target);

    void update()
    {
        if (this->reload > 0)
            this->reload--;
    }
    void reset() { this->reload = 0; }
    int getReload() const { return this->reload; }
};
