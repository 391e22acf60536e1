#include "scoreBoard.hpp"
#include <raylib.h>
#include <string>

bool ScoreLayout::isMirrored(float centerX) const
{
    bool playerWrong = this->playerStartX + this->playerWidth > centerX;
    bool botWrong = this->botStartX < centerX;
    return playerWrong && botWrong;
}

bool ScoreBoard::leftCollide()
{
    if (this->scoringElapse > 0)
        return false;
    this->botScore++;
    this->scoringElapse = this->scoringDelay;
    TraceLog(LOG_INFO, "SCORE: bot scored (%d:%d)", this->playerScore, this->botScore);
    return true;
}

bool ScoreBoard::rightCollide()
{
    if (this->scoringElapse > 0)
        return false;
    this->playerScore++;
    this->scoringElapse = this->scoringDelay;
    TraceLog(LOG_INFO, "SCORE: player scored (%d:%d)", this->playerScore, this->botScore);
    return true;
}

void ScoreBoard::update()
{
    if (this->scoringElapse > 0)
        this->scoringElapse--;
}

void ScoreBoard::reset()
{
    this->playerScore = 0;
    this->botScore = 0;
    this->scoringElapse = 0;
}

ScoreLayout ScoreBoard::layout(float centerX, int scale) const
{
    ScoreLayout l;
    std::string player = std::to_string(this->playerScore);
    std::string bot = std::to_string(this->botScore);

    l.advance = (float)(scale * 5);
    l.playerWidth = (float)(player.size() * scale * 4);
    l.botWidth = (float)(bot.size() * scale * 4);
    l.playerStartX = centerX - l.playerWidth - SCORE_GAP;
    l.botStartX = centerX + SCORE_GAP;
    return l;
}
