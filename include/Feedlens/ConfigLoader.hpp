// =================================================================
// include/Feedlens/ConfigLoader.hpp
// =================================================================
// Header for loading the orchestrator configuration from YAML.

#pragma once

#include "Feedlens/Orchestrator.hpp"
#include <string>

namespace YAML {
class Node;
}

namespace Feedlens {

/**
 * @brief Reads OrchestratorConfig from a YAML file
 *
 * Every key is optional; missing keys keep their defaults. The
 * configuration is read once at start-up.
 */
class ConfigLoader {
public:
    /**
     * @brief Load and validate a configuration file
     * @param path Path to the YAML file
     * @return Parsed configuration; defaults when the file does not exist
     * @throws ConfigError if the file is malformed or fails validation
     */
    static OrchestratorConfig loadFromFile(const std::string& path);

    /**
     * @brief Load and validate configuration from YAML text
     * @throws ConfigError if the text is malformed or fails validation
     */
    static OrchestratorConfig loadFromString(const std::string& yaml);

    /**
     * @brief Reject inconsistent settings
     * @throws ConfigError describing the first problem found
     */
    static void validate(const OrchestratorConfig& config);

private:
    static OrchestratorConfig fromNode(const YAML::Node& root);
};

} // namespace Feedlens
