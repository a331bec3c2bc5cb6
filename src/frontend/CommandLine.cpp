// File: CommandLine.cpp
// Description: Implements flag parsing and the usage text.

#include "frontend/CommandLine.hpp"

#include <cstdlib>
#include <stdexcept>

namespace frontend {

namespace {

std::filesystem::path expandFlagPath(const std::string& value) {
    return backend::expandHome(value, std::getenv("HOME"));
}

}  // namespace

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.action = CommandAction::ShowHelp;
            return options;
        }
        if (arg == "--version") {
            options.action = CommandAction::ShowVersion;
            return options;
        }
        if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
            continue;
        }

        const auto takeValue = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg + ".");
            }
            return args[++i];
        };

        if (arg == "--config") {
            options.configPath = takeValue();
        } else if (arg == "--export") {
            options.exportFile = takeValue();
        } else if (arg == "--downloads") {
            options.downloadFolder = takeValue();
        } else if (arg == "--out-dir") {
            options.reportFolder = takeValue();
        } else if (arg == "--roster") {
            options.rosterFile = takeValue();
        } else if (arg == "--log") {
            options.logFile = takeValue();
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return options;
}

void applyOverrides(backend::AppConfig& config, const CommandLineOptions& options) {
    if (options.exportFile) {
        config.exportFile = expandFlagPath(*options.exportFile);
    }
    if (options.downloadFolder) {
        config.downloadFolder = expandFlagPath(*options.downloadFolder);
    }
    if (options.reportFolder) {
        config.reportFolder = expandFlagPath(*options.reportFolder);
    }
    if (options.rosterFile) {
        config.rosterFile = expandFlagPath(*options.rosterFile);
    }
    if (options.logFile) {
        config.logFile = expandFlagPath(*options.logFile);
    }
    if (options.quiet) {
        config.quiet = true;
    }
}

void printUsage(std::ostream& os) {
    os << "Usage:\n"
       << "  attendance_report [options]\n"
       << "  attendance_report --help\n"
       << "  attendance_report --version\n"
       << "\n"
       << "Builds an attendance report from the newest meeting export in the\n"
       << "download folder, marking roster members who never joined as absent.\n"
       << "\n"
       << "Options:\n"
       << "  --config <path>     INI configuration file (default cfg.ini).\n"
       << "  --export <file>     Use this export instead of the newest one.\n"
       << "  --downloads <dir>   Folder searched for exports.\n"
       << "  --out-dir <dir>     Folder the report is written to.\n"
       << "  --roster <file>     Roster CSV of \"full name,group\" rows.\n"
       << "  --log <file>        Log file (default logs/attendance.log).\n"
       << "  --quiet, -q         Do not mirror log lines to the console.\n"
       << "  --help, -h          Print this help.\n"
       << "  --version           Print version.\n"
       << "\n"
       << "Environment:\n"
       << "  ATTENDANCE_DOWNLOAD_DIR, ATTENDANCE_REPORT_DIR,\n"
       << "  ATTENDANCE_ROSTER_FILE, ATTENDANCE_LOG_FILE\n";
}

}  // namespace frontend
