#include "projectile.hpp"
#include "paddle.hpp"
#include "arena.hpp"
#include <algorithm>

void ProjectileManager::fire(const Paddle &shooter, Paddle *target)
{
    if (!target)
        return;

    Vector2 from = shooter.hitboxCenter();
    Vector2 to = target->hitboxCenter();
    float speed = (to.x >= from.x) ? PROJECTILE_SPEED : -PROJECTILE_SPEED;

    Projectile p;
    p.rect = {from.x - PROJECTILE_WIDTH * 0.5f, from.y - PROJECTILE_HEIGHT * 0.5f,
              PROJECTILE_WIDTH, PROJECTILE_HEIGHT};
    p.speed = speed;
    p.target = target;
    this->projectiles.push_back(p);
}

int ProjectileManager::update(const Rectangle &despawn)
{
    int stunned = 0;
    for (auto &p : this->projectiles)
        p.rect.x += p.speed;

    auto removeIt = std::remove_if(this->projectiles.begin(), this->projectiles.end(), [&](Projectile &p) {
        if (!RectContains(despawn, p.rect))
            return true;

        if (p.target && CheckCollisionRecs(p.rect, p.target->hitbox()))
        {
            p.target->stun(this->stunTicks);
            TraceLog(LOG_INFO, "PROJECTILE: paddle stunned for %d ticks", this->stunTicks);
            stunned++;
            return true;
        }
        return false;
    });
    this->projectiles.erase(removeIt, this->projectiles.end());
    return stunned;
}

bool Launcher::tryFire(ProjectileManager &pm, const Paddle &shooter, Paddle *target)
{
    if (!this->canShoot())
        return false;

    pm.fire(shooter, target);
    this->reload = this->reloadPeriod;
    return true;
}
