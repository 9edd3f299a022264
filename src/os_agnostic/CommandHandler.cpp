/**
 * Parses and executes commands with deterministic paint order:
 *
 *   > prev command
 *   prev feedback
 *
 *   > current command
 *   current feedback
 *   reel frame
 *   > new prompt
 */

#include "CommandHandler.hpp"
#include "SlotMachine.hpp"
#include "Log.hpp"
#include <sstream>
#include <iostream>
#include <algorithm>
#include <functional>
#include <cctype>

static void toLowerInPlace(std::string& s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
}

static std::string trim(const std::string& s) {
  auto l = s.find_first_not_of(" \t");
  auto r = s.find_last_not_of(" \t");
  if (l == std::string::npos) return std::string{};
  return s.substr(l, r - l + 1);
}

static std::string trimQuotes(std::string s) {
  s = trim(s);
  if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
    s = s.substr(1, s.size()-2);
  }
  return s;
}

void CommandHandler::enqueue(std::string cmd) {
  {
    std::lock_guard<std::mutex> lk(queueMutex);
    commandQueue.push(std::move(cmd));
  }
  queueCv.notify_one();
}

// --- Internal: write the help block assuming coutMutex is already held ---
static void writeHelpUnlocked(std::ostream& os) {
  os << "Commands:\n"
     << "  help                              - displays the commands and its description\n"
     << "  spin                              - spins the reels (space on an empty prompt)\n"
     << "  pause                             - freezes the reels ('p' toggles)\n"
     << "  resume                            - continues a paused spin\n"
     << "  auto <n|inf>                      - spins n rounds, or until stopped\n"
     << "  auto stop                         - ends auto-spin after the current round\n"
     << "  set_speed <very-slow|slow|normal|fast|very-fast>\n"
     << "                                    - sets the spin speed\n"
     << "  set_instant <on|off>              - skips the reel animation\n"
     << "  set_bet <n>                       - sets the bet per spin (not while spinning)\n"
     << "  credits                           - shows the balance\n"
     << "  load_config <path>                - reloads speed, instant and bet from a file\n"
     << "  exit                              - terminates the console\n";
}

// --- Internal: paint transaction to enforce exact line order and clear the old frame ---
static void paintEchoFeedbackFramePrompt(
    SlotContext& ctx,
    const std::string& enteredLine,
    const std::function<void(std::ostream&)>& feedbackWriter)
{
  std::lock_guard<std::mutex> lock(ctx.coutMutex);
  const int H = (std::max)(1, ctx.getFrameHeight());

  // 1) CLEAR the previous frame block: H lines above the (old) prompt anchor
  for (int k = 1; k <= H; ++k) {
    std::cout << "\x1b[u"
              << "\x1b[" << k << "F"
              << "\r\x1b[2K";
  }

  // 2) Echo the entered command from where the frame used to start
  std::cout << "\x1b[u"
            << "\x1b[" << H << "F"
            << "\r\x1b[2K> " << enteredLine
            << "\n";

  // 3) Feedback block (can be multi-line; writer prints trailing newlines)
  if (feedbackWriter) feedbackWriter(std::cout);

  // 4) Reserve H lines for the display to paint over
  for (int i = 0; i < H; ++i) {
    std::cout << "\x1b[2K" << "\n";
  }

  // 5) NEW prompt line and save a fresh anchor for Display/Keyboard
  std::cout << "\x1b[2K> "                     // prompt
            << "\x1b[s"                        // save NEW prompt anchor
            << std::flush;

  ctx.setHasPromptLine(true);
}

// Fallback one-line message using the same atomic repaint
static void paintMessage(SlotContext& ctx, const std::string& enteredLine, const std::string& msg) {
  paintEchoFeedbackFramePrompt(ctx, enteredLine, [&](std::ostream& os){
    os << msg << "\n";
  });
}

void CommandHandler::handleCommand(const std::string& line) {
  // Parse command + rest
  auto first_space = line.find_first_of(" \t");
  std::string cmd  = (first_space == std::string::npos) ? line : line.substr(0, first_space);
  std::string rest = (first_space == std::string::npos) ? std::string{} : line.substr(first_space + 1);
  toLowerInPlace(cmd);

  if (cmd.empty()) return;

  // HELP
  if (cmd == "help") {
    paintEchoFeedbackFramePrompt(ctx, line, [&](std::ostream& os){
      writeHelpUnlocked(os);
    });
    return;
  }

  // EXIT (no new prompt afterwards)
  if (cmd == "exit") {
    {
      std::lock_guard<std::mutex> lock(ctx.coutMutex);
      std::cout << "\x1b[u"              // prompt anchor
                << "\r\x1b[2K> " << line << "\n"
                << "Exiting...\n"
                << std::flush;
    }
    ctx.exitRequested.store(true);
    queueCv.notify_all();
    return;
  }

  // SPIN
  if (cmd == "spin") {
    SlotTable* t = table;
    SlotContext& c = ctx;
    ctx.post([t, &c](SlotMachine&, TimePoint now) {
      if (!t) return;
      const SpinStatus status = t->spin(now);
      if (status != SpinStatus::Accepted) {
        c.setStatus(std::string("Spin rejected: ") + toString(status) + ".");
      }
    });
    paintMessage(ctx, line, "Spin requested.");
    return;
  }

  // AUTO
  if (cmd == "auto") {
    std::string arg = trim(rest);
    toLowerInPlace(arg);
    if (!autoSpinner) {
      paintMessage(ctx, line, "Auto-spin not available.");
      return;
    }
    AutoSpinner* a = autoSpinner;
    SlotContext& c = ctx;

    if (arg == "stop") {
      ctx.post([a, &c](SlotMachine&, TimePoint) {
        if (!a->isActive()) {
          c.setStatus("Auto-spin is not running.");
          return;
        }
        a->requestStop();
        if (a->isActive()) c.setStatus("Auto-spin stops after this round.");
      });
      paintMessage(ctx, line, "Auto-spin stop requested.");
      return;
    }

    int count = 0;
    if (arg == "inf") {
      count = AutoSpinner::kInfinite;
    } else {
      std::istringstream iss(arg);
      if (!(iss >> count) || !iss.eof() || count <= 0) {
        paintMessage(ctx, line, "Usage: auto <n|inf> | auto stop");
        return;
      }
    }
    ctx.post([a, count, &c](SlotMachine&, TimePoint now) {
      if (!a->start(count, now)) {
        c.setStatus("Auto-spin already running.");
        return;
      }
      c.setStatus(count == AutoSpinner::kInfinite ? std::string("Auto-spin started.")
                                                  : "Auto-spin started for " + std::to_string(count) + " rounds.");
    });
    paintMessage(ctx, line, "Auto-spin requested.");
    return;
  }

  // PAUSE / RESUME
  if (cmd == "pause") {
    ctx.post([](SlotMachine& m, TimePoint now) { m.pause(now); });
    paintMessage(ctx, line, "Paused.");
    return;
  }
  if (cmd == "resume") {
    ctx.post([](SlotMachine& m, TimePoint now) { m.resume(now); });
    paintMessage(ctx, line, "Resumed.");
    return;
  }

  // SET SPEED
  if (cmd == "set_speed") {
    std::string arg = trim(rest);
    toLowerInPlace(arg);
    AnimationSpeed speed;
    if (!parseSpeed(arg, speed)) {
      paintMessage(ctx, line, "Usage: set_speed <very-slow|slow|normal|fast|very-fast>");
      return;
    }
    ctx.post([speed](SlotMachine& m, TimePoint) { m.setSpeed(speed); });
    paintMessage(ctx, line, std::string("Speed set to ") + toString(speed) + ".");
    return;
  }

  // SET INSTANT
  if (cmd == "set_instant") {
    std::string arg = trim(rest);
    toLowerInPlace(arg);
    if (arg != "on" && arg != "off") {
      paintMessage(ctx, line, "Usage: set_instant <on|off>");
      return;
    }
    const bool instant = (arg == "on");
    ctx.post([instant](SlotMachine& m, TimePoint) { m.setInstant(instant); });
    paintMessage(ctx, line, instant ? "Instant spins on." : "Instant spins off.");
    return;
  }

  // SET BET
  if (cmd == "set_bet") {
    int bet = -1;
    {
      std::istringstream iss(trim(rest));
      if (!(iss >> bet)) {
        paintMessage(ctx, line, "Usage: set_bet <n>");
        return;
      }
    }
    SlotTable* t = table;
    SlotContext& c = ctx;
    ctx.post([t, bet, &c](SlotMachine&, TimePoint) {
      if (!t) return;
      switch (t->setBet(bet)) {
        case BetChange::Changed:
          c.setStatus("Bet set to " + std::to_string(bet) + ".");
          break;
        case BetChange::OutOfRange:
          c.setStatus("Bet must be between " + std::to_string(t->wallet().minBet()) +
                      " and " + std::to_string(t->wallet().maxBet()) + ".");
          break;
        case BetChange::Locked:
          c.setStatus("Bet cannot change while the reels spin.");
          break;
      }
    });
    paintMessage(ctx, line, "Bet change requested.");
    return;
  }

  // CREDITS
  if (cmd == "credits") {
    SlotTable* t = table;
    SlotContext& c = ctx;
    ctx.post([t, &c](SlotMachine&, TimePoint) {
      if (!t) return;
      const Wallet& w = t->wallet();
      c.setStatus("Balance: " + std::to_string(w.credits()) + " credits, bet " + std::to_string(w.bet()) + ".");
    });
    paintMessage(ctx, line, "Balance shown below the reels.");
    return;
  }

  // LOAD CONFIG (runtime tunables only; the grid shape is fixed at startup)
  if (cmd == "load_config") {
    std::string path = trimQuotes(rest);
    if (!fileReader || !table) {
      paintMessage(ctx, line, "File reader not available.");
      return;
    }
    std::string text;
    std::vector<std::string> readProblems;
    if (!fileReader->readConfigText(path, text, readProblems)) {
      paintMessage(ctx, line, readProblems.empty() ? "Cannot read " + path : readProblems.front());
      return;
    }

    // merged onto the live settings on the frame thread
    SlotTable* t = table;
    SlotContext& c = ctx;
    ctx.post([t, text, path, &c](SlotMachine&, TimePoint) {
      std::vector<std::string> problems;
      if (t->reload(text, problems) || problems.empty()) {
        c.setStatus("Loaded " + path + ".");
        return;
      }
      for (const auto& p : problems) Log::warn("config: " + path + ": " + p);
      c.setStatus("Loaded " + path + " with problems: " + problems.front() +
                  (problems.size() > 1 ? " (+" + std::to_string(problems.size() - 1) + " more, see log)" : ""));
    });
    paintMessage(ctx, line, "Loading " + path + "...");
    return;
  }

  // Unknown
  paintMessage(ctx, line, "Unknown command. Type 'help'.");
}

void CommandHandler::operator()() {
  // >>> JOIN INIT PHASE
  ctx.phase_barrier.arrive_and_wait();

  while (!ctx.exitRequested.load()) {
    std::string command;
    {
      std::unique_lock<std::mutex> lock(queueMutex);
      queueCv.wait(lock, [&]{ return !commandQueue.empty() || ctx.exitRequested.load(); });
      if (ctx.exitRequested.load()) break;
      command = std::move(commandQueue.front());
      commandQueue.pop();
    }
    handleCommand(trim(command));
  }

  ctx.stop_latch.count_down();
}
