#pragma once
#include "tutorial.hpp"
#include "dialogBox.hpp"
#include "projectile.hpp"
#include "scene.hpp"

class Match;

/**
 * @brief Tutorial layer put on top of a game scene.
 *
 * While its stage waits for input the overlay pre-empts the match: the scene
 * skips the simulation and draws only the dialogue on a cleared surface.
 * After every simulated tick it lets the stage machine react to the scores.
 * It also owns the player's launcher, usable during the shooting probe.
 */
class TutorialOverlay
{
private:
    TutorialStateMachine machine;
    DialogBox dialog;
    Launcher playerLauncher;

public:
    TutorialOverlay();

    // True when the match must not advance this tick.
    bool preempt() const { return this->machine.isPaused(); }

    // Stage check after the match tick.
    bool afterTick(Match &match);

    /**
     * @brief Player shot, only honoured during the shooting probe.
     * @return true when a projectile was fired.
     */
    bool shoot(Match &match);

    /**
     * @brief Route a discrete event.
     * @return true when the stage changed.
     */
    bool handleEvent(const InputEvent &event, Match &match);

    // A move key was held; confirms the movement hint.
    bool handleMove(Match &match);

    /**
     * @brief Reset the match and arm the return chain when leaving for the menu.
     */
    void onReturnToMenu(Match &match);

    // Dialogue for the current stage into the active render target.
    void drawDialog();

    bool isCloseRequested() const { return this->machine.isCloseRequested(); }
    TutorialStateMachine &getStateMachine() { return this->machine; }
    const TutorialStateMachine &getStateMachine() const { return this->machine; }
};
