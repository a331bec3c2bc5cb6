// File: ConsoleUI.cpp
// Description: Implements the per-status and per-group console summary.

#include "frontend/ConsoleUI.hpp"

#include <iomanip>
#include <map>
#include <string>

namespace frontend {

namespace {

struct StatusCounts {
    int present{0};
    int partial{0};
    int absent{0};

    void add(backend::AttendanceStatus status) {
        switch (status) {
            case backend::AttendanceStatus::Present:
                ++present;
                break;
            case backend::AttendanceStatus::PartiallyPresent:
                ++partial;
                break;
            case backend::AttendanceStatus::Absent:
                ++absent;
                break;
        }
    }
};

}  // namespace

ConsoleUI::ConsoleUI(std::ostream& out) : m_out(out) {}

void ConsoleUI::render(const backend::PipelineResult& result,
                       const std::filesystem::path& reportPath) const {
    const backend::ReportHeader& header = result.report.header;

    StatusCounts total;
    std::map<std::string, StatusCounts> byGroup;
    for (const backend::AttendanceRecord& member : result.report.members) {
        total.add(member.presence);
        byGroup[member.group].add(member.presence);
    }

    m_out << "\n=== " << header.title << " ===\n";
    m_out << "Date: " << header.date << "\n";
    m_out << "Period: " << header.timeSlot << "\n";
    if (!result.stats.reconciled) {
        m_out << "Roster check skipped for consultation.\n";
    }
    if (result.stats.droppedRows > 0) {
        m_out << "Dropped " << result.stats.droppedRows << " row(s) with unusable names.\n";
    }

    m_out << "\n"
          << std::left << std::setw(16) << "Group" << std::right << std::setw(9) << "Present"
          << std::setw(9) << "Partial" << std::setw(9) << "Absent" << "\n";
    for (const auto& [group, counts] : byGroup) {
        m_out << std::left << std::setw(16) << group << std::right << std::setw(9)
              << counts.present << std::setw(9) << counts.partial << std::setw(9)
              << counts.absent << "\n";
    }
    m_out << std::left << std::setw(16) << "Total" << std::right << std::setw(9) << total.present
          << std::setw(9) << total.partial << std::setw(9) << total.absent << "\n";

    m_out << "\nReport written to " << reportPath.string() << "\n";
}

}  // namespace frontend
