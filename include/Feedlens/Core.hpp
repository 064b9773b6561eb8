// =================================================================
// include/Feedlens/Core.hpp
// =================================================================
// Defines the command-line application object.

#pragma once

#include "Feedlens/CliParser.hpp"
#include <memory>
#include <string>
#include <vector>

// Forward declarations to reduce header dependencies
namespace Feedlens {
    class Orchestrator;
}

namespace Feedlens {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor defined in the .cpp file because Orchestrator is forward-declared.
     */
    ~Core();

    /**
     * @brief Loads configuration and runs the selected command.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleAnalyze();
    int handleStatus();

    /**
     * @brief Loads configuration and builds the orchestrator.
     * @return False if the configuration could not be loaded.
     */
    bool initialize();

    std::vector<std::string> collectInputs() const;

    const Commands& m_commands;
    std::unique_ptr<Orchestrator> m_orchestrator;
};

} // namespace Feedlens
