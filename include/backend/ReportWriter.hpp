// File: ReportWriter.hpp
// Description: Declares serialization of the attendance report as a
//              semicolon-delimited UTF-8 file with a byte-order mark.

#pragma once

#include "backend/Attendance.hpp"

#include <filesystem>
#include <string>

namespace backend {

class ReportWriter {
public:
    static constexpr char kDelimiter = ';';

    // Full file contents, BOM included.
    std::string render(const AttendanceReport& report) const;

    // "Attendance report_<title>_<date>.csv" with path-hostile characters
    // replaced by '-'.
    std::string fileNameFor(const ReportHeader& header) const;

    // Renders first, then writes; throws FatalInputError when the file
    // cannot be written. Returns the path written.
    std::filesystem::path write(const AttendanceReport& report,
                                const std::filesystem::path& reportFolder) const;
};

}  // namespace backend
