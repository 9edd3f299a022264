/**
 * @file AudioHandler.hpp
 * @brief Plays sound cues for spin milestones.
 */

#pragma once

#include "SlotConfig.hpp"
#include "SpinCoordinator.hpp"
#include "../os_dependent/SoundLibrary.hpp"

/**
 * @brief The audio collaborator: listens to the spin coordinator and picks the sounds.
 *
 * One stop cue per reel, a win jingle when the spin pays, and an optional
 * looping music bed that follows the pause state. Missing files only mute
 * their cue.
 */
class AudioHandler : public SpinListener {
public:
    explicit AudioHandler(const SlotConfig& config);

    void onSpinStarted() override;
    void onColumnStopped(int columnNumber) override;
    void onSpinResolved(const WinResult& result) override;

    // Hooked to the machine's pause controller.
    void pauseAll();
    void resumeAll();

    void ping();

private:
    SFMLSoundPlayer stopCue;
    SFMLSoundPlayer winCue;
    SFMLSoundPlayer music;
    bool musicStarted = false;
};
