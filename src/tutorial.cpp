#include "tutorial.hpp"
#include "scoreBoard.hpp"
#include "constant.hpp"
#include <raylib.h>

TutorialStage NextStage(TutorialStage stage)
{
    switch (stage)
    {
    case TutorialStage::Intro:
        return TutorialStage::MoveHint;
    case TutorialStage::MoveHint:
        return TutorialStage::DifficultyProbe;
    case TutorialStage::EasyExplain:
    case TutorialStage::HardExplain:
        return TutorialStage::ShootExplain;
    case TutorialStage::ShootExplain:
        return TutorialStage::ShootProbe1;
    case TutorialStage::ShootProbe1:
        return TutorialStage::ShootProbe2;
    case TutorialStage::ShootProbe2:
        return TutorialStage::ShootProbe3;
    case TutorialStage::Success:
    case TutorialStage::Fail:
        return TutorialStage::Combat;
    case TutorialStage::ReturnWarn1:
        return TutorialStage::ReturnWarn2;
    case TutorialStage::ReturnWarn2:
        return TutorialStage::ReturnWarn3;
    case TutorialStage::ReturnWarn3:
        return TutorialStage::ReturnWarn4;
    case TutorialStage::ReturnWarn4:
        return TutorialStage::Closing;
    // Running stages only move through AdvanceCondition.
    case TutorialStage::DifficultyProbe:
    case TutorialStage::ShootProbe3:
    case TutorialStage::Combat:
    case TutorialStage::Closing:
    default:
        return stage;
    }
}

bool AdvanceCondition(TutorialStage stage, const ScoreState &scores, TutorialStage &next)
{
    if (stage == TutorialStage::DifficultyProbe)
    {
        if (scores.bot >= TUTORIAL_ESCALATE_BOT_SCORE)
        {
            next = TutorialStage::ShootExplain;
            return true;
        }
        if (scores.player >= TUTORIAL_EASY_PLAYER_SCORE && scores.player >= scores.bot * 2)
        {
            next = TutorialStage::EasyExplain;
            return true;
        }
        if (scores.bot >= TUTORIAL_HARD_BOT_SCORE && scores.bot >= scores.player * 2)
        {
            next = TutorialStage::HardExplain;
            return true;
        }
        return false;
    }

    if (stage == TutorialStage::ShootProbe3)
    {
        int playerGained = scores.player - scores.playerAtEntry;
        int botGained = scores.bot - scores.botAtEntry;
        if (playerGained < TUTORIAL_SHOOT_TARGET)
            return false;
        next = (botGained < TUTORIAL_SHOOT_TARGET) ? TutorialStage::Success : TutorialStage::Fail;
        return true;
    }

    return false;
}

bool IsPausedStage(TutorialStage stage)
{
    switch (stage)
    {
    case TutorialStage::DifficultyProbe:
    case TutorialStage::ShootProbe3:
    case TutorialStage::Combat:
        return false;
    default:
        return true;
    }
}

const char *StageName(TutorialStage stage)
{
    switch (stage)
    {
    case TutorialStage::Intro: return "intro";
    case TutorialStage::MoveHint: return "move_hint";
    case TutorialStage::DifficultyProbe: return "difficulty_probe";
    case TutorialStage::EasyExplain: return "easy_explain";
    case TutorialStage::HardExplain: return "hard_explain";
    case TutorialStage::ShootExplain: return "shoot_explain";
    case TutorialStage::ShootProbe1: return "shoot_probe_1";
    case TutorialStage::ShootProbe2: return "shoot_probe_2";
    case TutorialStage::ShootProbe3: return "shoot_probe_3";
    case TutorialStage::Success: return "success";
    case TutorialStage::Fail: return "fail";
    case TutorialStage::ReturnWarn1: return "return_warn_1";
    case TutorialStage::ReturnWarn2: return "return_warn_2";
    case TutorialStage::ReturnWarn3: return "return_warn_3";
    case TutorialStage::ReturnWarn4: return "return_warn_4";
    case TutorialStage::Closing: return "closing";
    case TutorialStage::Combat: return "combat";
    }
    return "unknown";
}

const char *StageDialogue(TutorialStage stage)
{
    switch (stage)
    {
    case TutorialStage::Intro:
        return "Welcome to Pong! You are the paddle on the left. Keep the ball out of your goal.";
    case TutorialStage::MoveHint:
        return "Press W to move up and S to move down. Give it a try.";
    case TutorialStage::EasyExplain:
        return "That looked too easy. The bot reacts faster from now on.";
    case TutorialStage::HardExplain:
        return "Rough start. The bot will go easier on you for a while.";
    case TutorialStage::ShootExplain:
        return "The bot has learned to shoot. A hit freezes your paddle for a moment.";
    case TutorialStage::ShootProbe1:
        return "You can shoot too: hold SPACE. A stunned bot cannot move.";
    case TutorialStage::ShootProbe2:
        return "Score 5 points before the bot does. Ready?";
    case TutorialStage::Success:
        return "You won! That is all there is to learn. Enjoy the free play.";
    case TutorialStage::Fail:
        return "The bot got there first. Keep practising in free play.";
    case TutorialStage::ReturnWarn1:
        return "You already finished the tutorial.";
    case TutorialStage::ReturnWarn2:
        return "Really, there is nothing new here.";
    case TutorialStage::ReturnWarn3:
        return "Go back and play a real game.";
    case TutorialStage::ReturnWarn4:
        return "Last warning.";
    case TutorialStage::Closing:
        return "Fine. Goodbye.";
    case TutorialStage::DifficultyProbe:
    case TutorialStage::ShootProbe3:
    case TutorialStage::Combat:
        return "";
    }
    return "";
}

PaddleTuning EasyTuning(const PaddleTuning &current)
{
    PaddleTuning t = current;
    t.controlDelay = TUTORIAL_EASY_CONTROL_DELAY;
    return t;
}

PaddleTuning HardTuning(const PaddleTuning &current)
{
    PaddleTuning t = current;
    t.impulse = current.impulse / 2.0f;
    t.controlDelay = current.controlDelay * 2;
    return t;
}

void TutorialStateMachine::enter(TutorialStage next, const ScoreBoard &scores)
{
    TraceLog(LOG_INFO, "TUTORIAL: %s -> %s", StageName(this->stage), StageName(next));
    this->stage = next;
    this->playerAtEntry = scores.getPlayerScore();
    this->botAtEntry = scores.getBotScore();

    if (next == TutorialStage::Success || next == TutorialStage::Fail)
        this->completed = true;
}

bool TutorialStateMachine::checkStage(const ScoreBoard &scores, Paddle &bot)
{
    ScoreState state;
    state.player = scores.getPlayerScore();
    state.bot = scores.getBotScore();
    state.playerAtEntry = this->playerAtEntry;
    state.botAtEntry = this->botAtEntry;

    TutorialStage next = this->stage;
    if (!AdvanceCondition(this->stage, state, next))
        return false;

    if (next == TutorialStage::EasyExplain)
        bot.setTuning(EasyTuning(bot.getTuning()));
    else if (next == TutorialStage::HardExplain)
        bot.setTuning(HardTuning(bot.getTuning()));

    if (next == TutorialStage::EasyExplain || next == TutorialStage::HardExplain)
    {
        const PaddleTuning &t = bot.getTuning();
        TraceLog(LOG_INFO, "TUTORIAL: bot tuning now impulse %.1f, delay %d", t.impulse, t.controlDelay);
    }

    this->enter(next, scores);
    return true;
}

bool TutorialStateMachine::advance(const ScoreBoard &scores)
{
    if (!this->isPaused() || this->stage == TutorialStage::MoveHint)
        return false;

    if (this->stage == TutorialStage::Closing)
    {
        if (!this->closeRequested)
            TraceLog(LOG_WARNING, "TUTORIAL: closing stage confirmed, shutting down");
        this->closeRequested = true;
        return false;
    }

    this->enter(NextStage(this->stage), scores);
    return true;
}

bool TutorialStateMachine::advanceOnMove(const ScoreBoard &scores)
{
    if (this->stage != TutorialStage::MoveHint)
        return false;
    this->enter(NextStage(this->stage), scores);
    return true;
}

void TutorialStateMachine::onReturnToMenu()
{
    // Scores restart from 0:0, so do the probe baselines.
    this->playerAtEntry = 0;
    this->botAtEntry = 0;
    if (!this->completed)
        return;
    this->stage = TutorialStage::ReturnWarn1;
    TraceLog(LOG_INFO, "TUTORIAL: completed earlier, next visit starts at %s", StageName(this->stage));
}
