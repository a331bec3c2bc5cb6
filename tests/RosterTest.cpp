// File: RosterTest.cpp
// Description: Tests roster parsing and group lookup.

#include "backend/Attendance.hpp"
#include "backend/Errors.hpp"
#include "backend/Roster.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <vector>

using backend::Roster;
using backend::RosterEntry;

TEST(Roster, lookupReturnsFirstMatchingGroup)
{
    const Roster roster({{"Ivanov Ivan Ivanovich", "МП-21"},
                         {"Petrov Petr Petrovich", "МТ-22"},
                         {"Ivanov Ivan Ivanovich", "МК-23"}});
    EXPECT_EQ("МП-21", roster.lookupGroup("Ivanov Ivan Ivanovich"));
    EXPECT_EQ("МТ-22", roster.lookupGroup("Petrov Petr Petrovich"));
}

TEST(Roster, missIsGuest)
{
    const Roster roster(std::vector<RosterEntry>{{"Ivanov Ivan Ivanovich", "МП-21"}});
    EXPECT_EQ(backend::kGuestGroup, roster.lookupGroup("Sidorov Sidor"));
    EXPECT_EQ(backend::kGuestGroup, roster.lookupGroup("ivanov ivan ivanovich"));
    EXPECT_EQ(backend::kGuestGroup, Roster{}.lookupGroup("Anyone"));
}

TEST(Roster, parsesCsvWithBomQuotesAndBlankLines)
{
    const Roster roster = backend::parseRoster(
        "\xEF\xBB\xBFIvanov Ivan Ivanovich,МП-21\r\n"
        "\n"
        "\"Smith, John\",МТ-22\n"
        "Petrov Petr,МК-23,extra\n");
    ASSERT_EQ(3U, roster.size());
    EXPECT_EQ("Ivanov Ivan Ivanovich", roster.entries()[0].fullName);
    EXPECT_EQ("МП-21", roster.entries()[0].group);
    EXPECT_EQ("Smith, John", roster.entries()[1].fullName);
    EXPECT_EQ("МК-23", roster.entries()[2].group);
}

TEST(Roster, shortRowIsFatal)
{
    EXPECT_THROW(backend::parseRoster("Ivanov Ivan,МП-21\nLonely\n"), backend::FatalInputError);
}

TEST(Roster, missingFileIsFatal)
{
    const auto missing = std::filesystem::temp_directory_path() / "attendance_no_such_roster.csv";
    std::filesystem::remove(missing);
    EXPECT_THROW(backend::loadRosterFile(missing), backend::FatalInputError);
}

TEST(Roster, loadsFromFile)
{
    const auto path = std::filesystem::temp_directory_path() / "attendance_roster_test.csv";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "Ivanov Ivan Ivanovich,МП-21\nPetrov Petr Petrovich,МП-21\n";
    }
    const Roster roster = backend::loadRosterFile(path);
    EXPECT_EQ(2U, roster.size());
    EXPECT_EQ("МП-21", roster.lookupGroup("Petrov Petr Petrovich"));
    std::filesystem::remove(path);
}
