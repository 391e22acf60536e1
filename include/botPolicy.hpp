#pragma once
#include "projectile.hpp"

class Match;
class Paddle;
class TutorialStateMachine;

/**
 * @brief Decides the bot paddle's commands once per tick.
 *
 * Called after the bodies moved and before the match settles, so it sees the
 * post-update ball and paddle state.
 */
class BotPolicy
{
public:
    virtual ~BotPolicy() = default;
    virtual void control(Match &match) = 0;
    // Forget per-match state (reload timers) when the match restarts.
    virtual void reset() {}
};

/**
 * @brief Pure reactive follow: move toward the ball's centre line.
 */
class BasicBotPolicy : public BotPolicy
{
public:
    void control(Match &match) override;

    // Steer `pad` toward `targetY`; does nothing when already level.
    static void Follow(Paddle &pad, float targetY);
};

/**
 * @brief Bot used by the tutorial.
 *
 * Only while the tutorial is in its shooting probe: within
 * `BOT_ENGAGE_RANGE` of the ball it follows the ball (unless stunned);
 * farther away it tracks the player paddle instead and tries to shoot every
 * tick it is not aligned. Shots are gated by a reload timer. In every other
 * stage it behaves like BasicBotPolicy.
 */
class TutorialBotPolicy : public BotPolicy
{
private:
    const TutorialStateMachine *tutorial;
    Launcher launcher;
    BasicBotPolicy basic;

public:
    explicit TutorialBotPolicy(const TutorialStateMachine *stateMachine) : tutorial(stateMachine) {}

    void control(Match &match) override;
    void reset() override { this->launcher.reset(); }

    bool isOffenseActive() const;
    const Launcher &getLauncher() const { return this->launcher; }
};
