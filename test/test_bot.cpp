#include "testing.hpp"
#include "arena.hpp"
#include "botPolicy.hpp"
#include "match.hpp"
#include "tutorial.hpp"

namespace
{
Paddle makePaddle(Vector2 pos)
{
    return Paddle(pos, {0.0f, 0.0f, PADDLE_WIDTH, PADDLE_HEIGHT}, Arena().bounds, PADDLE_CONTROL_DELAY);
}
} // namespace

bool test_bot_follows_ball()
{
    Match m;
    BasicBotPolicy policy;

    // Ball centre (133) is above the bot centre (153).
    policy.control(m);
    EXPECT_NEAR(m.getBot().vel().y, -PADDLE_IMPULSE);

    Paddle low = makePaddle({BOT_START_X, PADDLE_START_Y});
    BasicBotPolicy::Follow(low, 200.0f);
    EXPECT_NEAR(low.vel().y, PADDLE_IMPULSE);

    // Level with the target: no command.
    Paddle level = makePaddle({BOT_START_X, PADDLE_START_Y});
    BasicBotPolicy::Follow(level, level.hitboxCenter().y);
    EXPECT_NEAR(level.vel().y, 0.0f);
    EXPECT(level.getLastPress() == 0);
    return true;
}

bool test_tutorial_bot_engages_ball_in_range()
{
    Match m;
    TutorialStateMachine sm;
    sm.setStage(TutorialStage::ShootProbe3, m.getScoreBoard());
    TutorialBotPolicy bot(&sm);
    EXPECT(bot.isOffenseActive());

    // Ball at the centre is 216 units from the bot: within range, so it
    // follows the ball and does not shoot.
    bot.control(m);
    EXPECT_NEAR(m.getBot().vel().y, -PADDLE_IMPULSE);
    EXPECT(m.getProjectiles().getProjectiles().empty());
    return true;
}

bool test_tutorial_bot_shoots_when_ball_far()
{
    Match m;
    TutorialStateMachine sm;
    TutorialBotPolicy bot(&sm);
    m.getBall().setPosition({40.0f, 100.0f});
    m.getPlayer().setPosition({PLAYER_START_X, 50.0f});

    // Outside the shooting probe the bot only follows the ball.
    EXPECT(!bot.isOffenseActive());
    bot.control(m);
    EXPECT(m.getProjectiles().getProjectiles().empty());

    Match shooting;
    sm.setStage(TutorialStage::ShootProbe3, shooting.getScoreBoard());
    shooting.getBall().setPosition({40.0f, 100.0f});
    shooting.getPlayer().setPosition({PLAYER_START_X, 50.0f});

    bot.control(shooting);
    EXPECT_NEAR(shooting.getBot().vel().y, -PADDLE_IMPULSE);
    EXPECT(shooting.getProjectiles().getProjectiles().size() == 1);
    EXPECT(bot.getLauncher().getReload() == RELOAD_PERIOD);

    // Reloading: no second shot on the next tick.
    bot.control(shooting);
    EXPECT(shooting.getProjectiles().getProjectiles().size() == 1);
    EXPECT(bot.getLauncher().getReload() == RELOAD_PERIOD - 1);

    // A stunned bot neither moves nor shoots.
    Match stunned;
    stunned.getBall().setPosition({40.0f, 100.0f});
    stunned.getPlayer().setPosition({PLAYER_START_X, 50.0f});
    stunned.getBot().stun(STUN_DURATION);
    bot.reset();
    bot.control(stunned);
    EXPECT_NEAR(stunned.getBot().vel().y, 0.0f);
    EXPECT(stunned.getProjectiles().getProjectiles().empty());
    return true;
}

bool test_projectile_stuns_target()
{
    Paddle shooter = makePaddle({100.0f, 100.0f});
    Paddle target = makePaddle({200.0f, 100.0f});
    ProjectileManager pm;
    pm.fire(shooter, &target);
    EXPECT(pm.getProjectiles().size() == 1);
    EXPECT(pm.getProjectiles()[0].speed > 0.0f);

    Rectangle despawn = Arena().despawn;
    int stuns = 0;
    for (int i = 0; i < 20; i++)
        stuns += pm.update(despawn);

    EXPECT(stuns == 1);
    EXPECT(target.getStunTime() == STUN_DURATION);
    EXPECT(!shooter.isStunned());
    EXPECT(pm.getProjectiles().empty());
    return true;
}

bool test_projectile_despawns()
{
    Paddle shooter = makePaddle({100.0f, 100.0f});
    Paddle target = makePaddle({300.0f, 180.0f});
    ProjectileManager pm;
    pm.fire(shooter, &target);

    Rectangle despawn = Arena().despawn;
    int stuns = 0;
    for (int i = 0; i < 60; i++)
        stuns += pm.update(despawn);

    EXPECT(stuns == 0);
    EXPECT(!target.isStunned());
    EXPECT(pm.getProjectiles().empty());

    Launcher launcher(3);
    EXPECT(launcher.tryFire(pm, shooter, &target));
    EXPECT(!launcher.tryFire(pm, shooter, &target));
    launcher.update();
    launcher.update();
    launcher.update();
    EXPECT(launcher.canShoot());
    return true;
}
