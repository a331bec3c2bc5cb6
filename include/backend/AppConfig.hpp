// File: AppConfig.hpp
// Description: Declares run configuration and its layered resolution from OS
//              defaults, the INI file and environment variables.

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace backend {

enum class HostOs { Linux, MacOs, Windows };

struct AppConfig {
    std::filesystem::path downloadFolder{"."};
    std::filesystem::path reportFolder{"."};
    std::filesystem::path rosterFile{"GroupsBase.csv"};
    std::filesystem::path logFile{"logs/attendance.log"};
    std::optional<std::filesystem::path> exportFile;
    std::vector<std::string> groupPrefixes;
    bool quiet{false};
};

// section -> key -> value; keys and section names are case-sensitive.
using IniDocument = std::map<std::string, std::map<std::string, std::string>>;

using EnvironmentLookup = std::function<const char*(const char*)>;

HostOs currentHostOs() noexcept;

AppConfig defaultConfig(HostOs os);

// Accepts "[section]" headers, "key = value" pairs and ';' or '#' comment
// lines. Throws FatalInputError on any other line.
IniDocument parseIni(const std::string& content);

// Empty values leave the current setting untouched.
void applyIni(AppConfig& config, const IniDocument& document);

void applyEnvironment(AppConfig& config, const EnvironmentLookup& lookup);

// "~" and "~/..." resolve against home; other paths are returned unchanged.
std::filesystem::path expandHome(const std::string& path, const char* home);

// Defaults for the host, then the INI file, then the process environment.
// Throws FatalInputError when the file cannot be read or parsed.
AppConfig loadAppConfig(const std::filesystem::path& iniPath);

std::string describe(const AppConfig& config);

}  // namespace backend
