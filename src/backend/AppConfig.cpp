// File: AppConfig.cpp
// Description: Implements configuration defaults, INI parsing and environment
//              overrides.

#include "backend/AppConfig.hpp"

#include "backend/DelimitedText.hpp"
#include "backend/Errors.hpp"
#include "backend/IdentityParser.hpp"
#include "backend/TextUtils.hpp"

#include <cstdlib>
#include <sstream>

namespace backend {

namespace {

std::filesystem::path resolvePath(const std::string& value) {
    return expandHome(value, std::getenv("HOME"));
}

std::vector<std::string> parsePrefixList(const std::string& value) {
    std::vector<std::string> prefixes;
    for (const std::string& part : split(value, ',')) {
        const std::string prefix = trim(part);
        if (!prefix.empty()) {
            prefixes.push_back(prefix);
        }
    }
    return prefixes;
}

const std::string* findValue(const IniDocument& document,
                             const std::string& section,
                             const std::string& key) {
    const auto sectionIt = document.find(section);
    if (sectionIt == document.end()) {
        return nullptr;
    }
    const auto keyIt = sectionIt->second.find(key);
    if (keyIt == sectionIt->second.end() || keyIt->second.empty()) {
        return nullptr;
    }
    return &keyIt->second;
}

}  // namespace

HostOs currentHostOs() noexcept {
#if defined(_WIN32)
    return HostOs::Windows;
#elif defined(__APPLE__)
    return HostOs::MacOs;
#else
    return HostOs::Linux;
#endif
}

AppConfig defaultConfig(HostOs os) {
    AppConfig config;
    config.groupPrefixes = IdentityParser::defaultGroupPrefixes();
    switch (os) {
        case HostOs::Windows:
            config.downloadFolder = "C:\\Users\\user\\Downloads\\";
            config.reportFolder = "C:\\Users\\user\\Desktop\\";
            break;
        case HostOs::MacOs:
            config.downloadFolder = resolvePath("~/Downloads/");
            config.reportFolder = resolvePath("~/Desktop/");
            break;
        case HostOs::Linux:
            config.downloadFolder = ".";
            config.reportFolder = ".";
            break;
    }
    return config;
}

std::filesystem::path expandHome(const std::string& path, const char* home) {
    if (home == nullptr || path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() == 1) {
        return std::filesystem::path(home);
    }
    if (path[1] == '/' || path[1] == '\\') {
        return std::filesystem::path(home) / path.substr(2);
    }
    return path;
}

IniDocument parseIni(const std::string& content) {
    const std::string text = startsWithUtf8Bom(content) ? content.substr(3) : content;
    IniDocument document;
    std::string section;

    std::istringstream stream(text);
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(stream, line)) {
        ++lineNumber;
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == ';' || trimmed[0] == '#') {
            continue;
        }
        if (trimmed.front() == '[') {
            if (trimmed.back() != ']') {
                throw FatalInputError("Malformed section header at config line " +
                                      std::to_string(lineNumber) + ": " + trimmed);
            }
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            document[section];
            continue;
        }
        const std::size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            throw FatalInputError("Expected 'key = value' at config line " +
                                  std::to_string(lineNumber) + ": " + trimmed);
        }
        std::string value = trim(trimmed.substr(equals + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        document[section][trim(trimmed.substr(0, equals))] = value;
    }
    return document;
}

void applyIni(AppConfig& config, const IniDocument& document) {
    if (const std::string* value = findValue(document, "paths", "download_folder_path")) {
        config.downloadFolder = resolvePath(*value);
    }
    if (const std::string* value = findValue(document, "paths", "report_location_folder")) {
        config.reportFolder = resolvePath(*value);
    }
    if (const std::string* value = findValue(document, "paths", "roster_file")) {
        config.rosterFile = resolvePath(*value);
    }
    if (const std::string* value = findValue(document, "paths", "log_file")) {
        config.logFile = resolvePath(*value);
    }
    if (const std::string* value = findValue(document, "parsing", "group_prefixes")) {
        const std::vector<std::string> prefixes = parsePrefixList(*value);
        if (!prefixes.empty()) {
            config.groupPrefixes = prefixes;
        }
    }
}

void applyEnvironment(AppConfig& config, const EnvironmentLookup& lookup) {
    const auto apply = [&](const char* name, std::filesystem::path& target) {
        const char* value = lookup(name);
        if (value != nullptr && value[0] != '\0') {
            target = resolvePath(value);
        }
    };
    apply("ATTENDANCE_DOWNLOAD_DIR", config.downloadFolder);
    apply("ATTENDANCE_REPORT_DIR", config.reportFolder);
    apply("ATTENDANCE_ROSTER_FILE", config.rosterFile);
    apply("ATTENDANCE_LOG_FILE", config.logFile);
}

AppConfig loadAppConfig(const std::filesystem::path& iniPath) {
    AppConfig config = defaultConfig(currentHostOs());
    applyIni(config, parseIni(readFileBytes(iniPath)));
    applyEnvironment(config, [](const char* name) { return std::getenv(name); });
    return config;
}

std::string describe(const AppConfig& config) {
    std::ostringstream oss;
    oss << "downloads=" << config.downloadFolder.string()
        << " reports=" << config.reportFolder.string()
        << " roster=" << config.rosterFile.string()
        << " log=" << config.logFile.string()
        << " groupPrefixes=" << join(config.groupPrefixes, ",");
    if (config.exportFile) {
        oss << " export=" << config.exportFile->string();
    }
    return oss.str();
}

}  // namespace backend
