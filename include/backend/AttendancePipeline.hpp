// File: AttendancePipeline.hpp
// Description: Declares the batch pipeline that turns raw export rows into a
//              sorted, roster-reconciled attendance report.

#pragma once

#include "backend/Attendance.hpp"
#include "backend/ExportReader.hpp"
#include "backend/IdentityParser.hpp"
#include "backend/PresenceClassifier.hpp"
#include "backend/Roster.hpp"
#include "backend/TimeClassifier.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace backend {

// Everything a run reads but never changes. The roster is borrowed and must
// outlive the context.
struct PipelineContext {
    explicit PipelineContext(const Roster& rosterRef,
                             IdentityParser parser = IdentityParser{});

    const Roster& roster;
    IdentityParser identityParser;
    TimeIntervalClassifier timeClassifier;
    PresenceClassifier presenceClassifier;
    ExportLayout layout;
    std::vector<std::string> organizerMarkers{"Organizer", "Инициатор"};
    std::string platformDefaultTitle{"General"};
};

struct PipelineStats {
    std::size_t participantRows{0};
    std::size_t organizerRows{0};
    std::size_t droppedRows{0};
    std::size_t observed{0};
    std::size_t absentees{0};
    bool reconciled{false};
};

struct PipelineResult {
    AttendanceReport report;
    PipelineStats stats;
};

class AttendancePipeline {
public:
    explicit AttendancePipeline(const PipelineContext& context);

    PipelineResult run(const RawExport& rawExport) const;

    ReportHeader buildHeader(const RawExport& rawExport) const;

    // std::nullopt for organizer rows and for names that cannot be parsed.
    std::optional<AttendanceRecord> classifyRow(const DelimitedRow& row) const;

    bool isOrganizerRow(const DelimitedRow& row) const;

private:
    const PipelineContext& m_context;
};

}  // namespace backend
