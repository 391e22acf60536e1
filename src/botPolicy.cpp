#include "botPolicy.hpp"
#include "match.hpp"
#include "tutorial.hpp"
#include <cmath>

void BasicBotPolicy::Follow(Paddle &pad, float targetY)
{
    float centerY = pad.hitboxCenter().y;
    if (centerY > targetY)
        pad.control(PaddleMove::Up);
    if (centerY < targetY)
        pad.control(PaddleMove::Down);
}

void BasicBotPolicy::control(Match &match)
{
    Follow(match.getBot(), match.getBall().hitboxCenter().y);
}

bool TutorialBotPolicy::isOffenseActive() const
{
    return this->tutorial && this->tutorial->getStage() == TutorialStage::ShootProbe3;
}

void TutorialBotPolicy::control(Match &match)
{
    if (!this->isOffenseActive())
    {
        this->basic.control(match);
        return;
    }

    this->launcher.update();

    Paddle &bot = match.getBot();
    Paddle &player = match.getPlayer();
    float distance = fabsf(bot.hitboxCenter().x - match.getBall().hitboxCenter().x);

    if (distance <= BOT_ENGAGE_RANGE)
    {
        if (bot.isStunned())
            return;
        BasicBotPolicy::Follow(bot, match.getBall().hitboxCenter().y);
        return;
    }

    // Ball is far away: line up with the player and keep shooting at them.
    float botY = bot.hitboxCenter().y;
    float playerY = player.hitboxCenter().y;
    if (botY == playerY || bot.isStunned())
        return;

    bot.control(botY > playerY ? PaddleMove::Up : PaddleMove::Down);
    if (this->launcher.tryFire(match.getProjectiles(), bot, &player))
        TraceLog(LOG_DEBUG, "BOT: fired, reload %d", this->launcher.getReload());
}
