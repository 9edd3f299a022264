/**
 * @file KeyboardHandler.hpp
 * @brief reads input from the player and sends it as commands.
 */

#pragma once

#include "Context.hpp"
#include "../os_dependent/Scanner.hpp"
#include <string>
#include <functional>

/**
 * @brief pushes commands into the system and manages keyboard input.
 *
 * Looks for key events using the platform-specific scanner. A finished line
 * (Enter) goes to the configured sink. On an empty prompt, space spins and
 * 'p' toggles pause, so the machine can be played without typing.
*/

class KeyboardHandler : public Handler {
public:
    /**
     * @brief Provide access to shared context when building the handler.
     * @param c All components use the same SlotContext.
     */
    explicit KeyboardHandler(SlotContext& c) : Handler(c) {}

    /**
     * @brief Keyboard input is read and interpreted by the main loop.
     *
     * Handles Enter, typing, backspace and the empty-prompt hotkeys, and
     * leaves cleanly on Ctrl+C.
     */
    void operator()();

    /**
     * @brief Configures the function to execute upon entering a complete command.
     * @param sink A function that takes a line of completed input.
     */
    void setSink(std::function<void(std::string)> sink) {
        deliver = std::move(sink);  // injection point to deliver commands to command processor
    }

private:
    std::function<void(std::string)> deliver;  // holds the command sink callback
    bool pauseToggled = false;                 // last hotkey sent "pause"
};
