/**
 * @file CommandHandler.hpp
 * @brief Simple command runner for the slot console.
 *
 * This class reads command strings from a queue (usually pushed by the keyboard
 * thread) and runs them. Anything that touches the machine or the wallet is
 * posted to the frame thread through the context mailbox; this thread only
 * parses and prints feedback.
 *
 * Commands:
 *   - help
 *   - exit
 *   - spin
 *   - pause / resume
 *   - auto <n|inf> / auto stop
 *   - set_speed <very-slow|slow|normal|fast|very-fast>
 *   - set_instant <on|off>
 *   - set_bet <n>
 *   - credits
 *   - load_config <path>
 */

#pragma once

#include "Context.hpp"
#include "AutoSpinner.hpp"
#include "FileReaderHandler.hpp"
#include "SlotTable.hpp"

#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

/**
 * @class CommandHandler
 * @brief Consumes command lines and executes them, one by one.
 *
 * How to use:
 *  - Build it with a shared SlotContext.
 *  - Hook up the SlotTable, AutoSpinner and FileReaderHandler.
 *  - Run operator() on its own thread so it can block/wake on the queue.
 *  - Call enqueue() from any producer (like the keyboard thread).
 */
class CommandHandler : public Handler {
public:
    /**
     * @brief Make a handler that uses the given shared context.
     * @param c Shared SlotContext with all the shared flags, locks, etc.
     */
    explicit CommandHandler(SlotContext& c)
        : Handler(c), table(nullptr), autoSpinner(nullptr), fileReader(nullptr) {}

    /**
     * @brief Main loop that waits for commands and executes them.
     *
     * Blocks on a condition variable when the queue is empty. Exits when
     * ctx.exitRequested becomes true.
     */
    void operator()(); // consumer loop

    /**
     * @brief Table the spin, bet, balance and reload commands act on (from the frame thread).
     * @param t SlotTable to use (can be nullptr to detach).
     */
    void addSlotTable(SlotTable* t) { table = t; }

    /**
     * @brief Auto-spin run driven by the auto command.
     * @param a AutoSpinner to use (can be nullptr to detach).
     */
    void addAutoSpinner(AutoSpinner* a) { autoSpinner = a; }

    /**
     * @brief Provide a pointer to the file reader so we can reload config files.
     * @param f FileReaderHandler to use (can be nullptr to detach).
     */
    void addFileReaderHandler(FileReaderHandler* f) { fileReader = f; }

    /**
     * @brief Push a new command line into the queue.
     *
     * Thread-safe. Multiple producers can call this at the same time.
     *
     * @param cmd Raw command, e.g. "set_bet 20".
     */
    void enqueue(std::string cmd);

    /**
     * @brief Wake the consumer loop so it can observe exitRequested.
     */
    void wake() { queueCv.notify_all(); }

private:

    // >>> QUEUE STATE

    std::mutex queueMutex;                  // Protects access to the queue.
    std::condition_variable queueCv;        // Signals the consumer that there is work to do (or we are exiting)
    std::queue<std::string> commandQueue;   // Ensure command strings follow FIFO

    // >>> COLLABORATORS

    SlotTable* table;                 // touched only inside posted actions
    AutoSpinner* autoSpinner;         // same
    FileReaderHandler* fileReader;    // config reloads

    // >>> HELPERS

    /**
     * @brief Parse one command line and do the action.
     * @param line Full command line including any arguments.
     */
    void handleCommand(const std::string& line);
};
