// File: ExportLocator.cpp
// Description: Implements newest-export lookup by modification time.

#include "backend/ExportLocator.hpp"

#include "backend/Errors.hpp"

#include <system_error>

namespace backend {

std::vector<std::filesystem::path> ExportLocator::listExports(
    const std::filesystem::path& folder) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(folder, ec);
    if (ec) {
        throw FatalInputError("Failed to open folder " + folder.string() + ": " + ec.message());
    }

    std::vector<std::filesystem::path> exports;
    const std::filesystem::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw FatalInputError("Failed to list folder " + folder.string() + ": " +
                                  ec.message());
        }
        const std::filesystem::directory_entry& entry = *it;
        std::error_code statusEc;
        if (entry.is_regular_file(statusEc) && entry.path().extension() == ".csv") {
            exports.push_back(entry.path());
        }
    }
    if (ec) {
        throw FatalInputError("Failed to list folder " + folder.string() + ": " + ec.message());
    }
    return exports;
}

std::filesystem::path ExportLocator::findNewestExport(const std::filesystem::path& folder) const {
    const std::vector<std::filesystem::path> exports = listExports(folder);
    if (exports.empty()) {
        throw FatalInputError("No .csv exports found in " + folder.string() +
                              "; check the download folder setting.");
    }

    std::error_code ec;
    std::filesystem::path newest = exports.front();
    std::filesystem::file_time_type newestTime = std::filesystem::last_write_time(newest, ec);
    if (ec) {
        throw FatalInputError("Failed to stat " + newest.string() + ": " + ec.message());
    }
    for (std::size_t i = 1; i < exports.size(); ++i) {
        const auto candidateTime = std::filesystem::last_write_time(exports[i], ec);
        if (ec) {
            throw FatalInputError("Failed to stat " + exports[i].string() + ": " + ec.message());
        }
        if (candidateTime > newestTime) {
            newest = exports[i];
            newestTime = candidateTime;
        }
    }
    return newest;
}

}  // namespace backend
