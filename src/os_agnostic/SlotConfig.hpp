/**
 * @file SlotConfig.hpp
 * @brief Tunables of the machine and the console, with text-file loading.
 */

#pragma once

#include "FrameTime.hpp"
#include "Log.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct SpinTiming;

enum class AnimationSpeed { VerySlow, Slow, Normal, Fast, VeryFast };

const char* toString(AnimationSpeed speed);
bool parseSpeed(const std::string& name, AnimationSpeed& out);

struct SpeedPreset {
    Millis duration;
    double scrollSpeed;
    Millis autoSpinDelay;  // pause between rounds of an auto-spin run
};

// very-slow 3300/4, slow 2500/6, normal 1500/10, fast 800/16, very-fast 525/24
SpeedPreset presetFor(AnimationSpeed speed);

// Upper bound on symbol ids, so glyph.<id> keys cannot grow the atlas without limit.
constexpr int kMaxSymbols = 64;

/**
 * @brief Everything configurable, defaulted to the reference 3x5 machine.
 *
 * Loaded from a `key = value` file (see apply() for the keys); blank lines and
 * lines starting with '#' are ignored.
 */
struct SlotConfig {
    // >>> MACHINE

    int rows = 3;
    int columns = 5;
    int symbolCount = 6;
    double rowHeight = 185.0;

    // >>> TIMING

    Millis referenceFrame{16.67};
    Millis stagger{200.0};
    AnimationSpeed speed = AnimationSpeed::Normal;
    bool instant = false;
    int frameIntervalMs = 16;  // host frame loop period

    // >>> PAYOUT

    int creditsPerMatch = 10;
    int minRun = 3;

    // >>> WALLET

    int initialCredits = 1000;
    int bet = 10;
    int minBet = 1;
    int maxBet = 100;

    // >>> RANDOMNESS

    std::uint32_t seed = 0;  // 0 means seed from std::random_device

    // >>> PRESENTATION

    int cellWidth = 9;
    std::vector<std::string> glyphs{"KNIGHT", "WIZARD", "ARCHER", "WARRIOR", "BARMAID", "KING"};
    std::string stopSound;
    std::string winSound;
    std::string musicFile;

    // >>> LOGGING

    LogLevel logLevel = LogLevel::Warn;
    std::string logFile;

    // Timing of the next spin under the current speed and instant settings.
    SpinTiming timing() const;

    // First violated constraint, if any.
    std::optional<std::string> validate() const;

    /**
     * @brief Set one key from its text value.
     * @return false for an unknown key or a malformed value; the field is left unchanged then.
     */
    bool apply(const std::string& key, const std::string& value);

    /**
     * @brief Apply every `key = value` line of `text` on top of the current values.
     * @param errors Receives one message per rejected line (may be nullptr).
     * @return true when every line was accepted.
     */
    bool load(const std::string& text, std::vector<std::string>* errors);

    bool operator==(const SlotConfig&) const = default;
};
