// File: AttendancePipeline.cpp
// Description: Implements header extraction, per-row classification,
//              reconciliation and final ordering.

#include "backend/AttendancePipeline.hpp"

#include "backend/Errors.hpp"
#include "backend/Logger.hpp"
#include "backend/ReportAssembler.hpp"
#include "backend/RosterReconciler.hpp"

#include <algorithm>
#include <utility>

namespace backend {

PipelineContext::PipelineContext(const Roster& rosterRef, IdentityParser parser)
    : roster(rosterRef), identityParser(std::move(parser)) {}

AttendancePipeline::AttendancePipeline(const PipelineContext& context) : m_context(context) {}

ReportHeader AttendancePipeline::buildHeader(const RawExport& rawExport) const {
    const ExportLayout& layout = m_context.layout;
    ReportHeader header;

    const DelimitedRow& titleRow = rawExport.preamble.at(layout.titleRow);
    if (titleRow.size() > 1 && titleRow[1] != m_context.platformDefaultTitle) {
        header.title = titleRow[1];
    } else {
        header.title = kDefaultMeetingTitle;
    }

    const DelimitedRow& dateRow = rawExport.preamble.at(layout.dateTimeRow);
    if (dateRow.size() < 2) {
        throw FatalInputError("Export preamble row " + std::to_string(layout.dateTimeRow + 1) +
                              " does not carry the meeting start time.");
    }
    const DateTimeField start = splitDateTime(dateRow[1]);
    header.date = start.date;
    header.timeSlot = m_context.timeClassifier.classifySlot(parseClockTime(start.time));
    return header;
}

bool AttendancePipeline::isOrganizerRow(const DelimitedRow& row) const {
    if (row.size() <= ExportColumns::kRole) {
        return false;
    }
    const std::string& role = row[ExportColumns::kRole];
    const auto& markers = m_context.organizerMarkers;
    return std::find(markers.begin(), markers.end(), role) != markers.end();
}

std::optional<AttendanceRecord> AttendancePipeline::classifyRow(const DelimitedRow& row) const {
    if (isOrganizerRow(row)) {
        return std::nullopt;
    }

    const auto identity = m_context.identityParser.parse(row.at(ExportColumns::kDisplayName));
    if (!identity) {
        Logger::instance().warn("Dropping participant with unparseable name '" +
                                row.at(ExportColumns::kDisplayName) + "'.");
        return std::nullopt;
    }

    AttendanceRecord record;
    record.fullName = identity->canonicalName;
    record.group = identity->embeddedGroup.empty()
                       ? m_context.roster.lookupGroup(record.fullName)
                       : identity->embeddedGroup;

    const DateTimeField joined = splitDateTime(row.at(ExportColumns::kJoinDateTime));
    record.lateness = m_context.timeClassifier.classifyLateness(parseClockTime(joined.time));

    const DurationCategory duration =
        m_context.presenceClassifier.classify(row.at(ExportColumns::kDuration));
    record.durationCategory = duration;
    record.presence = presenceForDuration(duration);
    return record;
}

PipelineResult AttendancePipeline::run(const RawExport& rawExport) const {
    PipelineResult result;
    result.report.header = buildHeader(rawExport);

    std::vector<AttendanceRecord> observed;
    observed.reserve(rawExport.events.size());
    for (const DelimitedRow& row : rawExport.events) {
        ++result.stats.participantRows;
        if (isOrganizerRow(row)) {
            ++result.stats.organizerRows;
            continue;
        }
        auto record = classifyRow(row);
        if (!record) {
            ++result.stats.droppedRows;
            continue;
        }
        observed.push_back(std::move(*record));
    }
    result.stats.observed = observed.size();

    if (!isConsultation(result.report.header)) {
        RosterReconciler reconciler(m_context.roster);
        observed = reconciler.reconcile(observed, m_context.roster.entries());
        result.stats.absentees = observed.size() - result.stats.observed;
        result.stats.reconciled = true;
    } else {
        Logger::instance().log("Consultation session; roster reconciliation skipped.");
    }

    result.report.members = ReportAssembler{}.sort(std::move(observed));
    return result;
}

}  // namespace backend
