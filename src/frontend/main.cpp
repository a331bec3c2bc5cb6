// File: main.cpp
// Description: Resolves configuration, runs the attendance pipeline on the
//              newest export and writes the report.

#include "backend/AppConfig.hpp"
#include "backend/AttendancePipeline.hpp"
#include "backend/ExportLocator.hpp"
#include "backend/ExportReader.hpp"
#include "backend/Logger.hpp"
#include "backend/ReportWriter.hpp"
#include "backend/Roster.hpp"
#include "frontend/CommandLine.hpp"
#include "frontend/ConsoleUI.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int runReport(const frontend::CommandLineOptions& options) {
    backend::AppConfig config = backend::loadAppConfig(options.configPath);
    frontend::applyOverrides(config, options);

    backend::Logger& logger = backend::Logger::instance();
    logger.initialize(config.logFile.string(), !config.quiet);
    logger.log("Configuration: " + backend::describe(config));

    const std::filesystem::path exportPath =
        config.exportFile ? *config.exportFile
                          : backend::ExportLocator{}.findNewestExport(config.downloadFolder);
    logger.log("Reading export " + exportPath.string());
    const backend::RawExport rawExport = backend::readExportFile(exportPath);

    const backend::Roster roster = backend::loadRosterFile(config.rosterFile);
    logger.log("Loaded " + std::to_string(roster.size()) + " roster entries from " +
               config.rosterFile.string());

    const backend::PipelineContext context(roster, backend::IdentityParser(config.groupPrefixes));
    const backend::AttendancePipeline pipeline(context);
    const backend::PipelineResult result = pipeline.run(rawExport);
    logger.log("Period: " + result.report.header.timeSlot + "; observed " +
               std::to_string(result.stats.observed) + ", absent " +
               std::to_string(result.stats.absentees) + ", dropped " +
               std::to_string(result.stats.droppedRows) + ", organizer rows " +
               std::to_string(result.stats.organizerRows) + ".");

    const std::filesystem::path reportPath =
        backend::ReportWriter{}.write(result.report, config.reportFolder);
    logger.log("Report written to " + reportPath.string());

    frontend::ConsoleUI(std::cout).render(result, reportPath);
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    frontend::CommandLineOptions options;
    try {
        options = frontend::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        frontend::printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    if (options.action == frontend::CommandAction::ShowHelp) {
        frontend::printUsage(std::cout);
        return EXIT_SUCCESS;
    }
    if (options.action == frontend::CommandAction::ShowVersion) {
        std::cout << "attendance_report v" << frontend::kVersion << "\n";
        return EXIT_SUCCESS;
    }

    try {
        return runReport(options);
    } catch (const std::exception& ex) {
        backend::Logger& logger = backend::Logger::instance();
        logger.error(std::string("FATAL: ") + ex.what());
        if (!logger.isInitialized() || !logger.mirrorsToConsole()) {
            std::cerr << "FATAL: " << ex.what() << "\n";
        }
        return EXIT_FAILURE;
    }
}
