// File: ReportWriter.cpp
// Description: Implements report rendering and file output.

#include "backend/ReportWriter.hpp"

#include "backend/DelimitedText.hpp"
#include "backend/Errors.hpp"

#include <fstream>
#include <vector>

namespace backend {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string sanitizeFileNamePart(const std::string& part) {
    static const std::string hostile = "/\\:*?\"<>|";
    std::string out = part;
    for (char& ch : out) {
        if (hostile.find(ch) != std::string::npos ||
            static_cast<unsigned char>(ch) < 0x20) {
            ch = '-';
        }
    }
    return out;
}

}  // namespace

std::string ReportWriter::render(const AttendanceReport& report) const {
    const ReportHeader& header = report.header;
    std::vector<DelimitedRow> rows{
        {"Meeting title", header.title},
        {"Meeting date", header.date},
        {"Period", header.timeSlot},
        {""},
        {"Group", "FullName", "Presence", "Lateness", "Duration"},
    };

    for (const AttendanceRecord& member : report.members) {
        if (member.fullName.empty()) {
            continue;
        }
        rows.push_back({member.group,
                        member.fullName,
                        toString(member.presence),
                        member.lateness ? toString(*member.lateness) : std::string(),
                        member.durationCategory ? toString(*member.durationCategory)
                                                : std::string()});
    }

    std::string out = kUtf8Bom;
    for (const DelimitedRow& row : rows) {
        out += formatDelimitedRow(row, kDelimiter);
        out += '\n';
    }
    return out;
}

std::string ReportWriter::fileNameFor(const ReportHeader& header) const {
    return "Attendance report_" + sanitizeFileNamePart(header.title) + "_" +
           sanitizeFileNamePart(header.date) + ".csv";
}

std::filesystem::path ReportWriter::write(const AttendanceReport& report,
                                          const std::filesystem::path& reportFolder) const {
    const std::string contents = render(report);
    const std::filesystem::path target = reportFolder / fileNameFor(report.header);

    std::ofstream stream(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        throw FatalInputError("Failed to create report file: " + target.string());
    }
    stream << contents;
    stream.flush();
    if (!stream) {
        throw FatalInputError("Failed to write report file: " + target.string());
    }
    return target;
}

}  // namespace backend
