// File: CommandLine.hpp
// Description: Declares command-line parsing for the attendance_report tool.

#pragma once

#include "backend/AppConfig.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace frontend {

inline constexpr const char* kVersion = "1.0";

enum class CommandAction { Run, ShowHelp, ShowVersion };

struct CommandLineOptions {
    CommandAction action{CommandAction::Run};
    std::string configPath{"cfg.ini"};
    std::optional<std::string> exportFile;
    std::optional<std::string> downloadFolder;
    std::optional<std::string> reportFolder;
    std::optional<std::string> rosterFile;
    std::optional<std::string> logFile;
    bool quiet{false};
};

// Throws std::invalid_argument for unknown flags or a flag missing its value.
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

// Flags win over everything loaded from the file and the environment.
void applyOverrides(backend::AppConfig& config, const CommandLineOptions& options);

void printUsage(std::ostream& os);

}  // namespace frontend
