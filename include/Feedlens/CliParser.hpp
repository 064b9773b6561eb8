// =================================================================
// include/Feedlens/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Feedlens {

// Parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    std::string config_path = ".feedlens/config.yml";

    // Options for 'analyze'
    std::string kind;
    std::string input_file;
    std::vector<std::string> texts;
    long timeout_ms = 0;        // 0 = wait for every batch
    bool summary = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupAnalyzeCommand(CLI::App& app);
    void setupStatusCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Feedlens
