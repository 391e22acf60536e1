#include "testing.hpp"
#include "arena.hpp"
#include "scoreBoard.hpp"
#include "tutorial.hpp"

namespace
{
ScoreState scores(int player, int bot, int playerAtEntry = 0, int botAtEntry = 0)
{
    ScoreState s;
    s.player = player;
    s.bot = bot;
    s.playerAtEntry = playerAtEntry;
    s.botAtEntry = botAtEntry;
    return s;
}

Paddle makeBot()
{
    return Paddle({BOT_START_X, PADDLE_START_Y}, {0.0f, 0.0f, PADDLE_WIDTH, PADDLE_HEIGHT}, Arena().bounds,
                  PADDLE_CONTROL_DELAY);
}
} // namespace

bool test_difficulty_probe_routes()
{
    TutorialStage next = TutorialStage::DifficultyProbe;
    EXPECT(!AdvanceCondition(TutorialStage::DifficultyProbe, scores(0, 0), next));
    EXPECT(!AdvanceCondition(TutorialStage::DifficultyProbe, scores(7, 4), next));
    EXPECT(!AdvanceCondition(TutorialStage::DifficultyProbe, scores(4, 7), next));

    EXPECT(AdvanceCondition(TutorialStage::DifficultyProbe, scores(0, 10), next));
    EXPECT(next == TutorialStage::ShootExplain);

    // The escalation is checked first.
    EXPECT(AdvanceCondition(TutorialStage::DifficultyProbe, scores(20, 10), next));
    EXPECT(next == TutorialStage::ShootExplain);

    EXPECT(AdvanceCondition(TutorialStage::DifficultyProbe, scores(7, 0), next));
    EXPECT(next == TutorialStage::EasyExplain);
    EXPECT(AdvanceCondition(TutorialStage::DifficultyProbe, scores(8, 4), next));
    EXPECT(next == TutorialStage::EasyExplain);

    EXPECT(AdvanceCondition(TutorialStage::DifficultyProbe, scores(0, 7), next));
    EXPECT(next == TutorialStage::HardExplain);

    // Paused stages never move on scores.
    EXPECT(!AdvanceCondition(TutorialStage::Intro, scores(0, 10), next));
    return true;
}

bool test_easy_and_hard_tuning()
{
    TutorialStateMachine easy;
    ScoreBoard sb;
    Paddle bot = makeBot();
    easy.setStage(TutorialStage::DifficultyProbe, sb);
    sb.setScores(7, 0);
    EXPECT(easy.checkStage(sb, bot));
    EXPECT(easy.getStage() == TutorialStage::EasyExplain);
    EXPECT(bot.getTuning().controlDelay == TUTORIAL_EASY_CONTROL_DELAY);
    EXPECT_NEAR(bot.getTuning().impulse, PADDLE_IMPULSE);

    TutorialStateMachine hard;
    ScoreBoard hsb;
    Paddle hbot = makeBot();
    hard.setStage(TutorialStage::DifficultyProbe, hsb);
    hsb.setScores(0, 7);
    EXPECT(hard.checkStage(hsb, hbot));
    EXPECT(hard.getStage() == TutorialStage::HardExplain);
    EXPECT_NEAR(hbot.getTuning().impulse, PADDLE_IMPULSE / 2.0f);
    EXPECT(hbot.getTuning().controlDelay == PADDLE_CONTROL_DELAY * 2);

    // Both explanations lead to the shooting lesson.
    EXPECT(NextStage(TutorialStage::EasyExplain) == TutorialStage::ShootExplain);
    EXPECT(NextStage(TutorialStage::HardExplain) == TutorialStage::ShootExplain);
    return true;
}

bool test_shoot_probe_result()
{
    TutorialStage next = TutorialStage::ShootProbe3;
    EXPECT(!AdvanceCondition(TutorialStage::ShootProbe3, scores(4, 0), next));
    EXPECT(!AdvanceCondition(TutorialStage::ShootProbe3, scores(7, 0, 3, 0), next));

    EXPECT(AdvanceCondition(TutorialStage::ShootProbe3, scores(8, 4, 3, 2), next));
    EXPECT(next == TutorialStage::Success);

    EXPECT(AdvanceCondition(TutorialStage::ShootProbe3, scores(5, 6), next));
    EXPECT(next == TutorialStage::Fail);

    // Points are counted from entering the stage.
    TutorialStateMachine sm;
    ScoreBoard sb;
    Paddle bot = makeBot();
    sb.setScores(9, 12);
    sm.setStage(TutorialStage::ShootProbe3, sb);
    EXPECT(!sm.checkStage(sb, bot));
    sb.setScores(14, 13);
    EXPECT(sm.checkStage(sb, bot));
    EXPECT(sm.getStage() == TutorialStage::Success);
    EXPECT(sm.isCompleted());
    return true;
}

bool test_tutorial_walkthrough()
{
    TutorialStateMachine sm;
    ScoreBoard sb;
    Paddle bot = makeBot();

    EXPECT(sm.getStage() == TutorialStage::Intro);
    EXPECT(sm.isPaused());
    EXPECT(sm.advance(sb));
    EXPECT(sm.getStage() == TutorialStage::MoveHint);

    // The movement hint waits for a move, not for SPACE.
    EXPECT(!sm.advance(sb));
    EXPECT(sm.advanceOnMove(sb));
    EXPECT(sm.getStage() == TutorialStage::DifficultyProbe);
    EXPECT(!sm.isPaused());
    EXPECT(!sm.advance(sb));

    sb.setScores(1, 10);
    EXPECT(sm.checkStage(sb, bot));
    EXPECT(sm.getStage() == TutorialStage::ShootExplain);
    EXPECT(sm.advance(sb));
    EXPECT(sm.getStage() == TutorialStage::ShootProbe1);
    EXPECT(sm.advance(sb));
    EXPECT(sm.advance(sb));
    EXPECT(sm.getStage() == TutorialStage::ShootProbe3);
    EXPECT(sm.isShootingStage());
    EXPECT(!sm.isPaused());

    sb.setScores(6, 15);
    EXPECT(sm.checkStage(sb, bot));
    EXPECT(sm.getStage() == TutorialStage::Fail);
    EXPECT(sm.isCompleted());
    EXPECT(sm.advance(sb));
    EXPECT(sm.getStage() == TutorialStage::Combat);
    EXPECT(!sm.isPaused());
    EXPECT(!sm.checkStage(sb, bot));
    return true;
}

bool test_return_warning_chain()
{
    TutorialStateMachine fresh;
    fresh.onReturnToMenu();
    EXPECT(fresh.getStage() == TutorialStage::Intro);

    TutorialStateMachine sm;
    ScoreBoard sb;
    sm.setStage(TutorialStage::Success, sb);
    EXPECT(sm.isCompleted());
    sm.onReturnToMenu();
    EXPECT(sm.getStage() == TutorialStage::ReturnWarn1);

    for (int i = 0; i < 4; i++)
        EXPECT(sm.advance(sb));
    EXPECT(sm.getStage() == TutorialStage::Closing);
    EXPECT(!sm.isCloseRequested());

    EXPECT(!sm.advance(sb));
    EXPECT(sm.getStage() == TutorialStage::Closing);
    EXPECT(sm.isCloseRequested());
    return true;
}
