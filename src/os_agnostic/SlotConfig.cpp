/**
 * @file SlotConfig.cpp
 * @brief Tunables of the machine and the console, with text-file loading.
 */

#include "SlotConfig.hpp"
#include "SpinCoordinator.hpp"

#include <cctype>
#include <sstream>

const char* toString(AnimationSpeed speed) {
    switch (speed) {
        case AnimationSpeed::VerySlow: return "very-slow";
        case AnimationSpeed::Slow:     return "slow";
        case AnimationSpeed::Normal:   return "normal";
        case AnimationSpeed::Fast:     return "fast";
        case AnimationSpeed::VeryFast: return "very-fast";
    }
    return "normal";
}

bool parseSpeed(const std::string& name, AnimationSpeed& out) {
    if (name == "very-slow") { out = AnimationSpeed::VerySlow; return true; }
    if (name == "very-fast") { out = AnimationSpeed::VeryFast; return true; }
    if (name == "slow")   { out = AnimationSpeed::Slow;   return true; }
    if (name == "normal") { out = AnimationSpeed::Normal; return true; }
    if (name == "fast")   { out = AnimationSpeed::Fast;   return true; }
    return false;
}

SpeedPreset presetFor(AnimationSpeed speed) {
    switch (speed) {
        case AnimationSpeed::VerySlow: return {Millis{3300.0}, 4.0, Millis{400.0}};
        case AnimationSpeed::Slow:     return {Millis{2500.0}, 6.0, Millis{300.0}};
        case AnimationSpeed::Fast:     return {Millis{800.0}, 16.0, Millis{70.0}};
        case AnimationSpeed::VeryFast: return {Millis{525.0}, 24.0, Millis{50.0}};
        case AnimationSpeed::Normal:   break;
    }
    return {Millis{1500.0}, 10.0, Millis{150.0}};
}

SpinTiming SlotConfig::timing() const {
    const SpeedPreset preset = presetFor(speed);

    SpinTiming t;
    t.baseDuration = preset.duration;
    t.stagger = stagger;
    t.scrollSpeed = preset.scrollSpeed;
    t.instant = instant;
    return t;
}

std::optional<std::string> SlotConfig::validate() const {
    if (rows < 1 || columns < 1)       return "rows and columns must be at least 1";
    if (symbolCount < 1)               return "symbols must be at least 1";
    if (symbolCount > kMaxSymbols)     return "symbols must be at most " + std::to_string(kMaxSymbols);
    if (rowHeight <= 0.0)              return "row_height must be positive";
    if (referenceFrame.count() <= 0.0) return "reference_frame_ms must be positive";
    if (stagger.count() < 0.0)         return "stagger_ms must not be negative";
    if (frameIntervalMs < 1)           return "frame_interval_ms must be at least 1";
    if (minRun < 1)                    return "min_run must be at least 1";
    if (creditsPerMatch < 0)           return "credits_per_match must not be negative";
    if (minBet < 1 || maxBet < minBet) return "bet range is empty";
    if (bet < minBet || bet > maxBet)  return "bet is outside the bet range";
    if (initialCredits < 0)            return "initial_credits must not be negative";
    if (cellWidth < 3)                 return "cell_width must be at least 3";
    if (static_cast<int>(glyphs.size()) < symbolCount) return "every symbol needs a glyph";
    return std::nullopt;
}

namespace {
    std::string trim(const std::string& s) {
        auto l = s.find_first_not_of(" \t\r");
        auto r = s.find_last_not_of(" \t\r");
        if (l == std::string::npos) return std::string{};
        return s.substr(l, r - l + 1);
    }

    bool toInt(const std::string& v, int& out) {
        std::istringstream iss(v);
        int x;
        if (!(iss >> x) || !iss.eof()) return false;
        out = x;
        return true;
    }

    bool toDouble(const std::string& v, double& out) {
        std::istringstream iss(v);
        double x;
        if (!(iss >> x) || !iss.eof()) return false;
        out = x;
        return true;
    }

    bool toBool(std::string v, bool& out) {
        for (auto& ch : v) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (v == "true" || v == "on" || v == "1" || v == "yes")  { out = true;  return true; }
        if (v == "false" || v == "off" || v == "0" || v == "no") { out = false; return true; }
        return false;
    }
}

bool SlotConfig::apply(const std::string& key, const std::string& value) {
    double d = 0.0;

    if (key == "rows")              return toInt(value, rows);
    if (key == "columns")           return toInt(value, columns);
    if (key == "symbols")           return toInt(value, symbolCount);
    if (key == "row_height")        return toDouble(value, rowHeight);
    if (key == "frame_interval_ms") return toInt(value, frameIntervalMs);
    if (key == "credits_per_match") return toInt(value, creditsPerMatch);
    if (key == "min_run")           return toInt(value, minRun);
    if (key == "initial_credits")   return toInt(value, initialCredits);
    if (key == "bet")               return toInt(value, bet);
    if (key == "min_bet")           return toInt(value, minBet);
    if (key == "max_bet")           return toInt(value, maxBet);
    if (key == "cell_width")        return toInt(value, cellWidth);
    if (key == "instant")           return toBool(value, instant);
    if (key == "speed")             return parseSpeed(value, speed);
    if (key == "log_level")         return Log::parseLevel(value, logLevel);
    if (key == "log_file")    { logFile = value;   return true; }
    if (key == "sound.stop")  { stopSound = value; return true; }
    if (key == "sound.win")   { winSound = value;  return true; }
    if (key == "sound.music") { musicFile = value; return true; }

    if (key == "reference_frame_ms") {
        if (!toDouble(value, d)) return false;
        referenceFrame = Millis{d};
        return true;
    }
    if (key == "stagger_ms") {
        if (!toDouble(value, d)) return false;
        stagger = Millis{d};
        return true;
    }
    if (key == "seed") {
        std::istringstream iss(value);
        unsigned long s;
        if (!(iss >> s) || !iss.eof()) return false;
        seed = static_cast<std::uint32_t>(s);
        return true;
    }

    // glyph.<id>
    if (key.rfind("glyph.", 0) == 0) {
        int id = -1;
        if (!toInt(key.substr(6), id) || id < 0 || id >= kMaxSymbols || value.empty()) return false;
        if (static_cast<std::size_t>(id) >= glyphs.size()) glyphs.resize(id + 1);
        glyphs[id] = value;
        return true;
    }

    return false;
}

bool SlotConfig::load(const std::string& text, std::vector<std::string>* errors) {
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    bool ok = true;

    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            ok = false;
            if (errors) errors->push_back("line " + std::to_string(lineNo) + ": expected key = value");
            continue;
        }

        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));
        if (!apply(key, value)) {
            ok = false;
            if (errors) errors->push_back("line " + std::to_string(lineNo) + ": bad setting '" + key + "'");
        }
    }
    return ok;
}
