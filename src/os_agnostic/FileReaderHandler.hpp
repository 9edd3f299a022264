/**
 * @file FileReaderHandler.hpp
 * @brief Loads config files for the console.
*/
#pragma once

#include "Context.hpp"
#include "SlotConfig.hpp"
#include <string>
#include <vector>

/**
 * @brief manages reading plain-text config files.
 *
 * Used at startup (before any handler thread exists, through readFile) and by
 * the load_config command, which reports problems on the console.
*/
class FileReaderHandler : public Handler {
public:

    /**
     * @brief Provides access to shared context when building the file reader.
     * @param c The global SlotContext is referenced.
     */
    explicit FileReaderHandler(SlotContext& c) : Handler(c) {}

    /**
     * @brief Read a whole file.
     * @param path The path to load.
     * @param out Receives the content on success.
     * @param error Receives a readable reason on failure.
     * @return true when the file was read.
     */
    static bool readFile(const std::string& path, std::string& out, std::string& error);

    /**
     * @brief Read a config file for a runtime reload.
     *
     * Parsing happens later, on the frame thread, against the live settings.
     *
     * @param text Receives the file content.
     * @param problems Receives the read error on failure.
     * @return false when the file could not be read at all.
     */
    bool readConfigText(const std::string& path, std::string& text, std::vector<std::string>& problems);
};
