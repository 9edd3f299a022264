/**
 * @file FileReaderHandler.cpp
 * @brief Loads config files for the console.
 */


#include "FileReaderHandler.hpp"
#include "Log.hpp"
#include <fstream>
#include <sstream>

/**
 * @brief Reads the entire file at `path` into `out`.
 *
 * Upon failure (file not found, read error) `out` is untouched and `error`
 * says why.
 */
bool FileReaderHandler::readFile(const std::string& path, std::string& out, std::string& error) {
    try {
        std::ifstream in(path);  // open file stream

        if (!in) {
            error = "cannot open file: " + path;
            return false;
        }

        std::ostringstream ss;
        ss << in.rdbuf();  // fill the buffer with the entire file.

        if (in.bad()) {
            error = "read error: " + path;
            return false;
        }

        out = ss.str();
        return true;

    } catch (const std::exception& e) {
        // There was some sort of read error (permissions, I/O, etc.).
        error = "error reading file '" + path + "': " + e.what();
        return false;
    }
}

bool FileReaderHandler::readConfigText(const std::string& path, std::string& text, std::vector<std::string>& problems) {
    std::string error;
    if (!readFile(path, text, error)) {
        Log::error("config: " + error);
        problems.push_back(error);
        return false;
    }
    Log::info("config: read " + path);
    return true;
}
