#pragma once
#include "constant.hpp"

/**
 * @brief Horizontal placement of both score displays around the centre line.
 */
struct ScoreLayout
{
    float playerStartX = 0.0f;
    float playerWidth = 0.0f;
    float botStartX = 0.0f;
    float botWidth = 0.0f;
    float advance = 0.0f;

    /**
     * @brief Both displays sit on their own side of `centerX`.
     *
     * The player's score must end left of the centre line and the bot's must
     * start right of it. Seeing both on the wrong side at once means the
     * layout state is corrupt.
     */
    bool isMirrored(float centerX) const;
};

/**
 * @brief Player and bot scores with a shared post-score cooldown.
 *
 * Goal callbacks land here. While `scoringElapse` runs, further goal triggers
 * are ignored so a ball sitting in a goal region counts once.
 */
class ScoreBoard
{
private:
    int playerScore = 0;
    int botScore = 0;
    int scoringDelay;
    int scoringElapse = 0;

public:
    explicit ScoreBoard(int delayTicks = SCORING_DELAY) : scoringDelay(delayTicks) {}

    // Ball entered the left goal: the bot scores.
    bool leftCollide();
    // Ball entered the right goal: the player scores.
    bool rightCollide();

    // Count the cooldown down by one tick.
    void update();

    // Back to 0:0 with no cooldown (tutorial exit).
    void reset();

    /**
     * @brief Place the score digits for the current scores.
     *
     * The player score ends `SCORE_GAP` left of `centerX` (each digit takes
     * `scale * 4` units there), the bot score starts `SCORE_GAP` right of it.
     * Digits advance by `scale * 5`.
     */
    ScoreLayout layout(float centerX, int scale) const;

    int getPlayerScore() const { return this->playerScore; }
    int getBotScore() const { return this->botScore; }
    int getScoringElapse() const { return this->scoringElapse; }
    bool isCoolingDown() const { return this->scoringElapse > 0; }

    // Direct assignment, used by the tutorial probes and tests.
    void setScores(int player, int bot)
    {
        this->playerScore = player;
        this->botScore = bot;
    }
};
