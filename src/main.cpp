/**
 * Entry point.
 *
 * Usage: reel_console [config-file]
 */

#include "os_agnostic/FileReaderHandler.hpp"
#include "os_agnostic/Log.hpp"
#include "os_agnostic/SlotConfig.hpp"
#include "os_agnostic/SlotConsole.hpp"
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  SlotConfig config;
  if (argc > 1) {
    std::string text, error;
    if (!FileReaderHandler::readFile(argv[1], text, error)) {
      std::cerr << error << "\n";
      return 1;
    }
    std::vector<std::string> problems;
    if (!config.load(text, &problems)) {
      for (const auto& p : problems) std::cerr << argv[1] << ": " << p << "\n";
    }
  }

  // The reel window owns the terminal, so logs only go to a file.
  std::ofstream logStream;
  Log::setLevel(config.logLevel);
  if (!config.logFile.empty()) {
    logStream.open(config.logFile, std::ios::app);
    if (!logStream) {
      std::cerr << "cannot open log file: " << config.logFile << "\n";
      return 1;
    }
    Log::setSink(&logStream);
  }

  // Welcome banner
  std::cout << "\n\n***********************************************\n\n"
            << "Welcome to the Reel Console!\n\n"
            << "Reels: " << config.rows << " x " << config.columns
            << "   Credits: " << config.initialCredits
            << "   Bet: " << config.bet << "\n\n"
            << "Tip: Type 'help' to see available commands.\n"
            << "     Space spins, 'p' pauses.\n"
            << "\n***********************************************\n"
            << std::flush;

  int rc = 0;
  {
    SlotConsole console(config);
    if (!console.init()) {
      // init problems were logged to stderr while the default sink was still active
      rc = 1;
    } else {
      if (config.logFile.empty()) Log::setSink(nullptr);
      console.run();
      std::cout << "Finished Execution!\n";
    }
  }

  Log::setSink(nullptr);
  return rc;
}
