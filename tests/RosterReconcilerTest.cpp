// File: RosterReconcilerTest.cpp
// Description: Tests absentee synthesis against the roster.

#include "backend/Roster.hpp"
#include "backend/RosterReconciler.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using backend::AttendanceRecord;
using backend::AttendanceStatus;
using backend::Roster;
using backend::RosterReconciler;

namespace {

AttendanceRecord observedMember(const std::string& group, const std::string& name) {
    AttendanceRecord record;
    record.group = group;
    record.fullName = name;
    record.lateness = backend::Lateness::OnTime;
    record.durationCategory = backend::DurationCategory::Full;
    record.presence = AttendanceStatus::Present;
    return record;
}

Roster sampleRoster() {
    return Roster({{"Alpha A", "G1"},
                   {"Bravo B", "G1"},
                   {"Charlie C", "G1"},
                   {"Delta D", "G2"},
                   {"Echo E", "G2"},
                   {"Foxtrot F", "G3"}});
}

std::size_t countAbsent(const std::vector<AttendanceRecord>& records) {
    return static_cast<std::size_t>(
        std::count_if(records.begin(), records.end(), [](const AttendanceRecord& r) {
            return r.presence == AttendanceStatus::Absent;
        }));
}

}  // namespace

TEST(RosterReconciler, addsAbsenteesOfObservedGroupsOnly)
{
    const Roster roster = sampleRoster();
    const RosterReconciler reconciler(roster);
    const std::vector<AttendanceRecord> observed{observedMember("G1", "Alpha A"),
                                                 observedMember("G2", "Delta D")};

    const auto result = reconciler.reconcile(observed, roster.entries());
    ASSERT_EQ(5U, result.size());
    EXPECT_EQ("Alpha A", result[0].fullName);
    EXPECT_EQ("Delta D", result[1].fullName);

    EXPECT_EQ("Bravo B", result[2].fullName);
    EXPECT_EQ("Charlie C", result[3].fullName);
    EXPECT_EQ("Echo E", result[4].fullName);
    for (std::size_t i = 2; i < result.size(); ++i) {
        EXPECT_EQ(AttendanceStatus::Absent, result[i].presence);
        EXPECT_FALSE(result[i].lateness.has_value());
        EXPECT_FALSE(result[i].durationCategory.has_value());
    }
    EXPECT_EQ("G1", result[2].group);
    EXPECT_EQ("G2", result[4].group);
}

TEST(RosterReconciler, observedRecordsAreKeptUnchanged)
{
    const Roster roster = sampleRoster();
    const RosterReconciler reconciler(roster);
    std::vector<AttendanceRecord> observed{observedMember("G3", "Foxtrot F"),
                                           observedMember("Guest", "Stranger S")};
    observed[1].presence = AttendanceStatus::PartiallyPresent;

    const auto result = reconciler.reconcile(observed, roster.entries());
    ASSERT_EQ(2U, result.size());
    EXPECT_EQ(AttendanceStatus::Present, result[0].presence);
    EXPECT_EQ(AttendanceStatus::PartiallyPresent, result[1].presence);
    EXPECT_EQ(2U, observed.size());
}

TEST(RosterReconciler, matchingIsExact)
{
    const Roster roster = sampleRoster();
    const RosterReconciler reconciler(roster);
    const std::vector<AttendanceRecord> observed{observedMember("G2", "Delta  D"),
                                                 observedMember("G2", "echo e")};

    const auto result = reconciler.reconcile(observed, roster.entries());
    EXPECT_EQ(2U, countAbsent(result));
}

TEST(RosterReconciler, absenteeGroupComesFromLookup)
{
    // The roster lists "Alpha A" twice; lookup resolves to the first entry.
    const Roster roster({{"Alpha A", "G1"}, {"Alpha A", "G2"}});
    const RosterReconciler reconciler(roster);
    const std::vector<AttendanceRecord> observed{observedMember("G2", "Someone Else")};

    const auto result = reconciler.reconcile(observed, roster.entries());
    ASSERT_EQ(2U, result.size());
    EXPECT_EQ("Alpha A", result[1].fullName);
    EXPECT_EQ("G1", result[1].group);
}

TEST(RosterReconciler, duplicateRosterNamesYieldOneAbsentee)
{
    const Roster roster({{"Alpha A", "G1"}, {"Alpha A", "G1"}, {"Bravo B", "G1"}});
    const RosterReconciler reconciler(roster);
    const std::vector<AttendanceRecord> observed{observedMember("G1", "Bravo B")};

    EXPECT_EQ(1U, countAbsent(reconciler.reconcile(observed, roster.entries())));
}

TEST(RosterReconciler, emptyObservationAddsNothing)
{
    const Roster roster = sampleRoster();
    const RosterReconciler reconciler(roster);
    EXPECT_TRUE(reconciler.reconcile({}, roster.entries()).empty());
}

TEST(RosterReconciler, rerunOnOwnOutputAddsNothing)
{
    const Roster roster = sampleRoster();
    const RosterReconciler reconciler(roster);
    const std::vector<AttendanceRecord> observed{observedMember("G1", "Charlie C"),
                                                 observedMember("G2", "Echo E")};

    const auto first = reconciler.reconcile(observed, roster.entries());
    const auto second = reconciler.reconcile(first, roster.entries());
    ASSERT_EQ(first.size(), second.size());
    EXPECT_EQ(countAbsent(first), countAbsent(second));
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].fullName, second[i].fullName);
    }
}

TEST(RosterReconciler, rerunIsStableWhenNameIsListedUnderTwoGroups)
{
    const Roster roster({{"Alpha A", "G1"}, {"Alpha A", "G2"}, {"Zed Z", "G1"}});
    const RosterReconciler reconciler(roster);
    const std::vector<AttendanceRecord> observed{observedMember("G2", "Bravo B")};

    const auto first = reconciler.reconcile(observed, roster.entries());
    ASSERT_EQ(2U, first.size());
    EXPECT_EQ("Alpha A", first[1].fullName);
    EXPECT_EQ("G1", first[1].group);

    const auto second = reconciler.reconcile(first, roster.entries());
    ASSERT_EQ(first.size(), second.size());
    EXPECT_EQ(1U, countAbsent(second));
}

TEST(RosterReconciler, absentRecordsContributeNoGroup)
{
    AttendanceRecord absentee;
    absentee.group = "G3";
    absentee.fullName = "Foxtrot F";
    absentee.presence = AttendanceStatus::Absent;
    const auto groups =
        RosterReconciler::observedGroups({observedMember("G1", "Alpha A"), absentee});
    EXPECT_EQ((std::set<std::string>{"G1"}), groups);
}

TEST(RosterReconciler, observedGroupsAreDistinct)
{
    const auto groups = RosterReconciler::observedGroups(
        {observedMember("G2", "x"), observedMember("G1", "y"), observedMember("G2", "z")});
    EXPECT_EQ((std::set<std::string>{"G1", "G2"}), groups);
}
