// File: ReportWriterTest.cpp
// Description: Tests report rendering, file naming and file output.

#include "backend/Errors.hpp"
#include "backend/ReportWriter.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using backend::AttendanceRecord;
using backend::AttendanceReport;
using backend::AttendanceStatus;

namespace {

AttendanceReport sampleReport() {
    AttendanceReport report;
    report.header.title = "Math; lecture";
    report.header.date = "17.10.2026";
    report.header.timeSlot = "Period 1";

    AttendanceRecord present;
    present.group = "МП-21";
    present.fullName = "Ivanov Ivan Ivanovich";
    present.lateness = backend::Lateness::Late;
    present.durationCategory = backend::DurationCategory::Full;
    present.presence = AttendanceStatus::Present;

    AttendanceRecord absent;
    absent.group = "МП-21";
    absent.fullName = "Petrov Petr Petrovich";
    absent.presence = AttendanceStatus::Absent;

    AttendanceRecord organizer;
    organizer.fullName = "";

    report.members = {present, absent, organizer};
    return report;
}

}  // namespace

TEST(ReportWriter, rendersHeaderBlockAndMemberRows)
{
    const std::string expected =
        "\xEF\xBB\xBF"
        "Meeting title;\"Math; lecture\"\n"
        "Meeting date;17.10.2026\n"
        "Period;Period 1\n"
        "\n"
        "Group;FullName;Presence;Lateness;Duration\n"
        "МП-21;Ivanov Ivan Ivanovich;Present;Late;Full presence\n"
        "МП-21;Petrov Petr Petrovich;Absent;;\n";
    EXPECT_EQ(expected, backend::ReportWriter{}.render(sampleReport()));
}

TEST(ReportWriter, fileNameReplacesPathHostileCharacters)
{
    backend::ReportHeader header;
    header.title = "A/B: review?";
    header.date = "10/17/2026";
    EXPECT_EQ("Attendance report_A-B- review-_10-17-2026.csv",
              backend::ReportWriter{}.fileNameFor(header));
}

TEST(ReportWriter, writesIntoReportFolder)
{
    const auto folder = std::filesystem::temp_directory_path() / "attendance_report_writer_test";
    std::filesystem::remove_all(folder);
    std::filesystem::create_directories(folder);

    const backend::ReportWriter writer;
    const AttendanceReport report = sampleReport();
    const std::filesystem::path written = writer.write(report, folder);
    EXPECT_EQ(folder / "Attendance report_Math; lecture_17.10.2026.csv", written);

    std::ifstream in(written, std::ios::binary);
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(writer.render(report), contents);

    std::filesystem::remove_all(folder);
}

TEST(ReportWriter, missingFolderIsFatal)
{
    const auto folder = std::filesystem::temp_directory_path() / "attendance_missing_report_dir";
    std::filesystem::remove_all(folder);
    EXPECT_THROW(backend::ReportWriter{}.write(sampleReport(), folder), backend::FatalInputError);
}
