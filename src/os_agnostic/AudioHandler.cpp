/**
 * @file AudioHandler.cpp
 * @brief Plays sound cues for spin milestones.
 */

#include "AudioHandler.hpp"
#include "Log.hpp"

AudioHandler::AudioHandler(const SlotConfig& config) {
    if (!config.stopSound.empty()) stopCue.load(config.stopSound);
    if (!config.winSound.empty()) winCue.load(config.winSound);
    if (!config.musicFile.empty() && music.load(config.musicFile)) {
        music.setLoop(true);
    }
}

void AudioHandler::onSpinStarted() {
    winCue.stop();
    if (!musicStarted && music.isLoaded()) {
        music.play();
        musicStarted = true;
    }
}

void AudioHandler::onColumnStopped(int columnNumber) {
    // restart so back-to-back stops each get an audible click
    stopCue.stop();
    stopCue.play();
    Log::debug("audio: stop cue for reel " + std::to_string(columnNumber));
}

void AudioHandler::onSpinResolved(const WinResult& result) {
    if (result.isWin()) winCue.play();
}

void AudioHandler::pauseAll() {
    stopCue.pause();
    winCue.pause();
    music.pause();
}

void AudioHandler::resumeAll() {
    if (music.isPaused()) music.play();
    if (winCue.isPaused()) winCue.play();
    if (stopCue.isPaused()) stopCue.play();
}

void AudioHandler::ping() {
    Log::info(std::string("audio: handler connected (") +
              (stopCue.isLoaded() ? "stop " : "") +
              (winCue.isLoaded() ? "win " : "") +
              (music.isLoaded() ? "music" : "") + ")");
}
