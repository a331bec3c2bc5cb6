// File: ExportReader.hpp
// Description: Declares the reader for the platform's attendance export: a
//              UTF-16 tab-delimited file with a fixed preamble followed by one
//              row per participant.

#pragma once

#include "backend/DelimitedText.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace backend {

struct ExportLayout {
    std::size_t preambleRows{8};
    std::size_t titleRow{2};
    std::size_t dateTimeRow{3};
    std::size_t minimumEventFields{6};
};

// Column positions of a participant row.
struct ExportColumns {
    static constexpr std::size_t kDisplayName = 0;
    static constexpr std::size_t kJoinDateTime = 1;
    static constexpr std::size_t kDuration = 3;
    static constexpr std::size_t kRole = 5;
};

struct RawExport {
    std::vector<DelimitedRow> preamble;
    std::vector<DelimitedRow> events;
};

// UTF-8 with a BOM passes through; anything else is decoded as UTF-16.
std::string decodeExportText(const std::string& bytes);

// Throws FatalInputError when the preamble is short or a participant row has
// too few fields.
RawExport parseExport(const std::string& text, const ExportLayout& layout = ExportLayout{});

RawExport readExportFile(const std::filesystem::path& path,
                         const ExportLayout& layout = ExportLayout{});

}  // namespace backend
