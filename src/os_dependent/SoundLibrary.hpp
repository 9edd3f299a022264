/**
 * @file SoundLibrary.hpp
 * @brief Sound playback behind a small interface, backed by SFML audio.
 */

#pragma once

#include <SFML/Audio.hpp>

#include <string>

class AudioInterface {
    public:

    virtual ~AudioInterface() = default;

    virtual bool load(const std::string& file) = 0;
    virtual void play() = 0;
    virtual void stop() = 0;
    virtual void pause() = 0;
    virtual void setLoop(bool loop) = 0;
    virtual bool isPaused() const = 0;
};


// Streams one sound file; used for reel cues, the win jingle and the music bed.
class SFMLSoundPlayer : public AudioInterface {
  private:
  sf::Music music;
  bool loaded = false;

  public:

  bool load(const std::string& file) override;
  void play() override;
  void stop() override;
  void pause() override;
  void setLoop(bool loop) override;
  bool isPaused() const override;

  bool isLoaded() const { return loaded; }
};
