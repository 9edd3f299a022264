/**
 * @file Context.hpp
 * @brief Shares the state of the slot console with every handler thread.
 */

#pragma once

#include "FrameTime.hpp"

#include <atomic>
#include <barrier>
#include <functional>
#include <latch>
#include <mutex>
#include <string>
#include <vector>

class SlotMachine;

// >>> GLOBAL PARTICIPANT COUNT
#define NUM_SLOT_HANDLERS 4  // display, keyboard, command, supervisor

// >>> BARRIER COMPLETION (kept noexcept for MSVC compatibility)
struct PhaseCompletion {
    void operator()() noexcept {}
};

// Work for the frame thread. Runs with the machine and the frame's timestamp.
using EngineAction = std::function<void(SlotMachine&, TimePoint)>;

/**
 * @brief All slot console handlers share a thread-safe context.
 *
 * Holds console-related state, the engine mailbox and synchronization
 * primitives. The machine itself is not in here: only the display thread
 * touches it, and every other thread reaches it by posting an EngineAction.
 */
struct SlotContext {
public:

    // >>> PHASE & SHUTDOWN SYNC

    /** @brief Before beginning, all participating threads are synched with this barrier. */
    std::barrier<PhaseCompletion> phase_barrier{NUM_SLOT_HANDLERS};

    /** @brief Latch (threads call count_down()) to orchestrate smooth shutdown. */
    std::latch stop_latch{NUM_SLOT_HANDLERS};

    // >>> CONSOLE OUTPUT GUARD

    std::mutex coutMutex; // Mutex to stop console writes in parallel.

    // >>> GLOBAL EXIT FLAG

    std::atomic<bool> exitRequested{false}; // Used to alert all threads to shutdown.

    // >>> PROMPT & FRAME GEOMETRY

    /** @brief Configure the flag to know whether the prompt is visible. */
    void setHasPromptLine(bool v) { hasPromptLine.store(v); }

    /** @brief Verify whether the console prompt is visible at the moment. */
    bool getHasPromptLine() const { return hasPromptLine.load(); }

    /** @brief Number of lines the reel frame occupies above the prompt. */
    void setFrameHeight(int h) { frameHeight.store(h); }
    int getFrameHeight() const { return frameHeight.load(); }

    // >>> ENGINE MAILBOX

    /** @brief Queue work for the frame thread; it runs at the start of the next frame. */
    void post(EngineAction action) {
        std::lock_guard<std::mutex> lock(actionMutex);
        actions.push_back(std::move(action));
    }

    /** @brief Take everything queued so far, in posting order. */
    std::vector<EngineAction> takeActions() {
        std::lock_guard<std::mutex> lock(actionMutex);
        std::vector<EngineAction> out;
        out.swap(actions);
        return out;
    }

    // >>> STATUS LINE

    /** @brief Change the line shown under the reels. */
    void setStatus(const std::string& s) {
        std::lock_guard<std::mutex> lock(statusMutex);
        status = s;
    }

    /** @brief Get a copy of the status line that is currently displayed. */
    std::string getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return status;
    }

private:
    std::atomic<bool> hasPromptLine{false};
    std::atomic<int> frameHeight{1};

    std::mutex actionMutex;
    std::vector<EngineAction> actions;

    std::mutex statusMutex;
    std::string status{"Type 'spin' (or press space) to play."};
};

/**
 * @brief For any handler requiring access to the context's shared state.
 *
 * This is extended by all major handler types (e.g., DisplayHandler, CommandHandler).
 */
class Handler {
public:
    explicit Handler(SlotContext& c) : ctx(c) {}
    virtual ~Handler() = default;

protected:
    SlotContext& ctx;
};
