#include "SoundLibrary.hpp"
#include "../os_agnostic/Log.hpp"


bool SFMLSoundPlayer::load(const std::string& file) {
    loaded = false;
    if (file.empty()) return false;

    if (!music.openFromFile(file)) {
        Log::warn("audio: failed to load " + file);
        return false;
    }
    loaded = true;
    return true;
}

void SFMLSoundPlayer::play() {
    if (!loaded) return;
    music.play();
}

void SFMLSoundPlayer::stop() {
    if (!loaded) return;
    music.stop();
}

void SFMLSoundPlayer::pause() {
    if (!loaded) return;
    music.pause();
}

void SFMLSoundPlayer::setLoop(bool loop) {
    music.setLoop(loop);
}

bool SFMLSoundPlayer::isPaused() const {
    return loaded && music.getStatus() == sf::SoundSource::Paused;
}
