// =================================================================
// src/Feedlens/Core.cpp
// =================================================================
// Implementation for the command-line application logic.

#include "Feedlens/Core.hpp"
#include "Feedlens/ConfigLoader.hpp"
#include "Feedlens/Errors.hpp"
#include "Feedlens/HttpInferenceClient.hpp"
#include "Feedlens/InsightAggregator.hpp"
#include "Feedlens/Logger.hpp"
#include "Feedlens/Orchestrator.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <fstream>
#include <iostream>

namespace Feedlens {

static std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

Core::Core(const Commands& commands)
    : m_commands(commands) {}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    if (!initialize()) {
        return 1;
    }

    int exit_code = 1;
    if (m_commands.active_command == "analyze") {
        exit_code = handleAnalyze();
    } else if (m_commands.active_command == "status") {
        exit_code = handleStatus();
    } else {
        std::cerr << "Unknown command: " << m_commands.active_command << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration.count()));
    return exit_code;
}

bool Core::initialize() {
    OrchestratorConfig config;
    try {
        config = ConfigLoader::loadFromFile(m_commands.config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return false;
    }

    Logger::getInstance().configure(config.logging);

    std::shared_ptr<InferenceClient> client;
    if (config.remote.enabled) {
        client = std::make_shared<HttpInferenceClient>(config.remote);
    } else {
        LOG_INFO("Core", "Remote service disabled, all analysis runs locally");
    }

    m_orchestrator = std::make_unique<Orchestrator>(config, client);
    return true;
}

int Core::handleAnalyze() {
    auto kind = parseKind(m_commands.kind);
    if (!kind) {
        std::cerr << "Unknown analysis kind: " << m_commands.kind << std::endl;
        return 1;
    }

    std::vector<std::string> inputs;
    try {
        inputs = collectInputs();
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().logSessionStart("analyze " + kindToString(*kind), inputs.size());

    AnalysisRequest request;
    request.texts = inputs;
    request.kind = *kind;

    std::optional<std::chrono::milliseconds> timeout;
    if (m_commands.timeout_ms > 0) {
        timeout = std::chrono::milliseconds(m_commands.timeout_ms);
    }

    std::vector<AnalysisResult> results = m_orchestrator->submit(request, timeout);

    nlohmann::json output = results;
    if (m_commands.summary) {
        if (*kind == AnalysisKind::SENTIMENT) {
            LOG_WARNING("Core", "--summary applies to insight and summary analyses only");
        } else {
            output = nlohmann::json{
                {"results", results},
                {"combined", InsightAggregator::combine(results)}
            };
        }
    }

    std::cout << output.dump(2) << std::endl;
    return 0;
}

int Core::handleStatus() {
    nlohmann::json output = m_orchestrator->status();
    std::cout << output.dump(2) << std::endl;
    return 0;
}

std::vector<std::string> Core::collectInputs() const {
    std::vector<std::string> inputs;

    auto add_line = [&inputs](const std::string& line) {
        std::string text = trim(line);
        if (!text.empty()) {
            inputs.push_back(text);
        }
    };

    if (!m_commands.input_file.empty()) {
        std::ifstream file(m_commands.input_file);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open input file: " + m_commands.input_file);
        }
        std::string line;
        while (std::getline(file, line)) {
            add_line(line);
        }
    } else if (!m_commands.texts.empty()) {
        for (const auto& text : m_commands.texts) {
            add_line(text);
        }
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            add_line(line);
        }
    }

    return inputs;
}

} // namespace Feedlens
