// =================================================================
// src/Feedlens/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Feedlens/CliParser.hpp"

namespace Feedlens {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Feedlens: resilient feedback analysis with local fallback.");
    m_app->require_subcommand(1);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupAnalyzeCommand(*m_app);
    setupStatusCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupAnalyzeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("analyze", "Analyzes feedback texts and prints the results as JSON.");
    sub->add_option("kind", m_commands.kind, "Analysis kind: sentiment, insight or summary.")
        ->required()
        ->check(CLI::IsMember({"sentiment", "insight", "insights", "summary"}, CLI::ignore_case));
    auto* file = sub->add_option("-i,--input", m_commands.input_file, "File with one input per line.")
        ->check(CLI::ExistingFile);
    sub->add_option("texts", m_commands.texts, "Inputs given directly on the command line.")->excludes(file);
    sub->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file.");
    sub->add_option("--timeout-ms", m_commands.timeout_ms, "Deadline for the whole request in milliseconds.")
        ->check(CLI::NonNegativeNumber);
    sub->add_flag("--summary", m_commands.summary, "Also print a combined insight for the whole collection.");
}

void CliParser::setupStatusCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("status", "Prints the orchestrator health snapshot as JSON.");
    sub->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file.");
}

} // namespace Feedlens
