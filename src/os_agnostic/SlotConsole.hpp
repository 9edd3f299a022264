/**
 * @file SlotConsole.hpp
 * @brief Mainly handles the starting and shutting down of all threads.
 */

#pragma once

#include "AudioHandler.hpp"
#include "AutoSpinner.hpp"
#include "CommandHandler.hpp"
#include "Context.hpp"
#include "DisplayHandler.hpp"
#include "FileReaderHandler.hpp"
#include "KeyboardHandler.hpp"
#include "SlotConfig.hpp"
#include "SlotMachine.hpp"
#include "SlotTable.hpp"
#include "Wallet.hpp"
#include <thread>
#include <vector>

/**
 * @brief The top-level console controller that connects everything.
 *
 * Oversees the slot machine's setup and shutdown, including the frame
 * loop, keyboard input, command parsing and sound.
 * Aside from initiation, threads wire together here.
*/
class SlotConsole {
public:

    // Constructs the console and initializes connections of the handlers.
    explicit SlotConsole(const SlotConfig& config);
    ~SlotConsole();

    /**
     * @brief Bind the glyphs and deal the opening grid.
     * @return false when the machine cannot start with this config.
     */
    bool init();

    /**
     * @brief starts the console system and keeps it running until it shuts down.
     *
     * Launches every worker thread, including the supervisor thread that
     * watches for the exit signal. Joins everything at shutdown.
     */
    void run();

private:
    SlotContext ctx;                        // shared state across all handlers
    SlotConfig config;                      // startup settings
    SlotMachine machine;                    // spin engine, driven by the display thread
    Wallet wallet;                          // credits and bet
    SlotTable table;                        // stake, bet lock and payouts
    AutoSpinner autoSpinner;                // repeated spins, ticked by the display thread
    AudioHandler audio;                     // sound cues for spin milestones
    DisplayHandler display;                 // frame loop and reel window
    KeyboardHandler keyboard;               // captures inputs from keystrokes
    CommandHandler command;                 // processes and executes the corresponding actions of commands
    FileReaderHandler fileReader;           // config reloads
    std::vector<std::thread> threads;       // all handler and supervisor threads
};
