#include "tutorialOverlay.hpp"
#include "match.hpp"

TutorialOverlay::TutorialOverlay()
{
    this->dialog.setArea({56.0f, 72.0f, 400.0f, 112.0f});
}

bool TutorialOverlay::afterTick(Match &match)
{
    if (this->machine.isShootingStage())
        this->playerLauncher.update();
    return this->machine.checkStage(match.getScoreBoard(), match.getBot());
}

bool TutorialOverlay::shoot(Match &match)
{
    if (!this->machine.isShootingStage() || this->preempt())
        return false;
    if (match.getPlayer().isStunned())
        return false;
    return this->playerLauncher.tryFire(match.getProjectiles(), match.getPlayer(), &match.getBot());
}

bool TutorialOverlay::handleEvent(const InputEvent &event, Match &match)
{
    if (event.type != InputEvent::Type::KeyPressed)
        return false;
    if (event.key != KEY_SPACE && event.key != KEY_ENTER)
        return false;
    return this->machine.advance(match.getScoreBoard());
}

bool TutorialOverlay::handleMove(Match &match)
{
    return this->machine.advanceOnMove(match.getScoreBoard());
}

void TutorialOverlay::onReturnToMenu(Match &match)
{
    match.reset();
    this->playerLauncher.reset();
    this->machine.onReturnToMenu();
}

void TutorialOverlay::drawDialog()
{
    TutorialStage stage = this->machine.getStage();
    this->dialog.setText(this->machine.getDialogue());
    if (stage == TutorialStage::MoveHint)
        this->dialog.setHint("W / S to continue");
    else if (stage == TutorialStage::Closing)
        this->dialog.setHint("SPACE to quit");
    else
        this->dialog.setHint("SPACE to continue");
    this->dialog.Draw();
}
