/**
 * @file KeyboardHandler.cpp
 * @brief Keyboard handler using OS-dependent Scanner for per-key responsiveness.
 */

#include "KeyboardHandler.hpp"
#include <iostream>

/**
* @brief Makes sure the frame lines, cursor anchor and prompt exist on the console.
*
* On the first call this reserves one blank line per frame line (the display
* paints over them) and puts the prompt underneath.
*
* @param ctx Shared context with display state and prompt.
*/
static void ensurePromptAnchor(SlotContext& ctx) {
    if (!ctx.getHasPromptLine()) {
        std::lock_guard<std::mutex> lock(ctx.coutMutex);

        const int H = ctx.getFrameHeight();
        for (int i = 0; i < H; ++i) std::cout << "\n";  // reel frame lines

        std::cout << "> "       // print prompt
                  << "\x1b[s"   // save anchor at end of prompt
                  << std::flush;

        ctx.setHasPromptLine(true);
    }
}

/**
 * @brief Redraws the buffer text at the anchor position and the current prompt line.
 *
 * @param ctx Shared context with prompt state and cursor lock.
 * @param buf The input buffer that the player is currently typing.
*/
static void redrawPrompt(SlotContext& ctx, const std::string& buf) {
    std::lock_guard<std::mutex> lock(ctx.coutMutex);

    std::cout << "\x1b[u"         // restore to prompt anchor
              << "\r\x1b[2K> "    // clear prompt line and print prompt symbol
              << buf              // show buffer
              << "\x1b[s"         // re-save anchor at end-of-line
              << std::flush;

    ctx.setHasPromptLine(true);
}

/**
 * @brief The keyboard handler's main loop.
 *
 * Buffers keys into a line and delivers it on Enter. Space and 'p' on an
 * empty buffer are shortcuts for "spin" and "pause"/"resume".
*/
void KeyboardHandler::operator()() {
    // >>> JOIN INIT PHASE
    ctx.phase_barrier.arrive_and_wait();

    Scanner scan;
    std::string buffer;

    if (!scan.isInteractive()) {
        std::lock_guard<std::mutex> lock(ctx.coutMutex);
        std::cout << "(stdin is not a terminal; keys are read line by line)\n" << std::flush;
    }

    ensurePromptAnchor(ctx);

    while (!ctx.exitRequested.load()) {
        // If something else cleared the prompt, re-anchor
        if (!ctx.getHasPromptLine()) {
            ensurePromptAnchor(ctx);
        }

        int ch = scan.poll(10);  // wait up to 10 ms for a key
        if (ch < 0) continue;

        if (buffer.empty() && ch == ' ') {
            if (deliver) deliver("spin");
            continue;
        }
        if (buffer.empty() && (ch == 'p' || ch == 'P')) {
            pauseToggled = !pauseToggled;
            if (deliver) deliver(pauseToggled ? "pause" : "resume");
            continue;
        }

        if (ch == '\n' || ch == '\r') {
            const std::string submitted = buffer;
            buffer.clear();
            if (submitted == "pause") pauseToggled = true;
            if (submitted == "resume") pauseToggled = false;

            if (deliver) deliver(submitted);

        } else if (ch == 3) {  // Ctrl+C pressed
            ctx.exitRequested.store(true);
            break;

        } else if (ch == 127 || ch == 8) {  // Backspace
            if (!buffer.empty()) {
                buffer.pop_back();
                redrawPrompt(ctx, buffer);
            }

        } else if (ch >= 32 && ch < 127) {  // Printable ASCII
            buffer.push_back(static_cast<char>(ch));
            redrawPrompt(ctx, buffer);
        }
    }

    // Clear prompt line on exit
    {
        std::lock_guard<std::mutex> lock(ctx.coutMutex);
        std::cout << "\x1b[u"     // return to prompt anchor
                  << "\r\x1b[2K"  // clear that line
                  << std::flush;
    }

    ctx.setHasPromptLine(false);

    // >>> THREAD EXIT
    ctx.stop_latch.count_down();
}
