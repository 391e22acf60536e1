#pragma once
#include "paddle.hpp"

class ScoreBoard;

/**
 * @brief Tutorial progress. Each stage has its dialogue and pause state.
 */
enum class TutorialStage
{
    Intro,
    MoveHint,
    DifficultyProbe,
    EasyExplain,
    HardExplain,
    ShootExplain,
    ShootProbe1,
    ShootProbe2,
    ShootProbe3,
    Success,
    Fail,
    ReturnWarn1,
    ReturnWarn2,
    ReturnWarn3,
    ReturnWarn4,
    Closing,
    Combat, // Free play after the tutorial
};

/**
 * @brief Scores seen by the stage conditions.
 *
 * `playerAtEntry`/`botAtEntry` are the scores when the current stage was
 * entered, so probes can count points made during the stage.
 */
struct ScoreState
{
    int player = 0;
    int bot = 0;
    int playerAtEntry = 0;
    int botAtEntry = 0;
};

// Stage reached from `stage` on an "advance" input.
TutorialStage NextStage(TutorialStage stage);

/**
 * @brief Score-driven reroute evaluated every running tick.
 *
 * @param stage Current stage.
 * @param scores Current and stage-entry scores.
 * @param next Set to the new stage when a condition holds.
 * @return true when the stage must change.
 */
bool AdvanceCondition(TutorialStage stage, const ScoreState &scores, TutorialStage &next);

// Stages that wait for player input; the match is frozen meanwhile.
bool IsPausedStage(TutorialStage stage);

const char *StageName(TutorialStage stage);
const char *StageDialogue(TutorialStage stage);

// Bot tuning after the player dominated the probe: faster reactions.
PaddleTuning EasyTuning(const PaddleTuning &current);
// Bot tuning after the bot dominated the probe: half impulse, double delay.
PaddleTuning HardTuning(const PaddleTuning &current);

/**
 * @brief Drives the scripted tutorial.
 *
 * Paused stages advance on input (`advance()`, or `advanceOnMove()` for the
 * movement hint). Running stages are rerouted by `checkStage()` from the
 * scores; entering the easy or hard explanation swaps the bot's tuning.
 * Once a result (success or fail) was reached the tutorial is completed, and
 * leaving to the menu arms the return-warning chain for the next visit.
 */
class TutorialStateMachine
{
private:
    TutorialStage stage = TutorialStage::Intro;
    bool completed = false;
    bool closeRequested = false;
    int playerAtEntry = 0;
    int botAtEntry = 0;

    void enter(TutorialStage next, const ScoreBoard &scores);

public:
    /**
     * @brief Evaluate score conditions for the current stage.
     * @param scores Live scoreboard.
     * @param bot Bot paddle whose tuning may be swapped.
     * @return true when the stage changed.
     */
    bool checkStage(const ScoreBoard &scores, Paddle &bot);

    /**
     * @brief Confirm the current dialogue and move along the table.
     *
     * Ignored in running stages and in the movement hint. Confirming the
     * closing stage requests the application to shut down.
     */
    bool advance(const ScoreBoard &scores);

    // The movement hint is confirmed by moving.
    bool advanceOnMove(const ScoreBoard &scores);

    /**
     * @brief Leaving the tutorial for the menu.
     *
     * A completed tutorial restarts at the first return warning next time.
     */
    void onReturnToMenu();

    // Projectiles are in play only during the shooting probe.
    bool isShootingStage() const { return this->stage == TutorialStage::ShootProbe3; }

    bool isPaused() const { return IsPausedStage(this->stage); }
    TutorialStage getStage() const { return this->stage; }
    bool isCompleted() const { return this->completed; }
    bool isCloseRequested() const { return this->closeRequested; }
    const char *getDialogue() const { return StageDialogue(this->stage); }

    // Jump straight to a stage, counting probe scores from `scores`.
    void setStage(TutorialStage next, const ScoreBoard &scores) { this->enter(next, scores); }
};
