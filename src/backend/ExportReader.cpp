// File: ExportReader.cpp
// Description: Implements export decoding and the preamble/participant split.

#include "backend/ExportReader.hpp"

#include "backend/Errors.hpp"
#include "backend/TextUtils.hpp"

#include <cstddef>
#include <iterator>

namespace backend {

std::string decodeExportText(const std::string& bytes) {
    if (startsWithUtf8Bom(bytes)) {
        return bytes.substr(3);
    }
    return decodeUtf16(bytes);
}

RawExport parseExport(const std::string& text, const ExportLayout& layout) {
    std::vector<DelimitedRow> rows = parseDelimited(text, '\t');
    if (rows.size() < layout.preambleRows) {
        throw FatalInputError("Export holds " + std::to_string(rows.size()) +
                              " row(s); the preamble alone needs " +
                              std::to_string(layout.preambleRows) + ".");
    }

    RawExport result;
    const auto preambleEnd = rows.begin() + static_cast<std::ptrdiff_t>(layout.preambleRows);
    result.preamble.assign(std::make_move_iterator(rows.begin()),
                           std::make_move_iterator(preambleEnd));
    result.events.assign(std::make_move_iterator(preambleEnd),
                         std::make_move_iterator(rows.end()));

    for (std::size_t i = 0; i < result.events.size(); ++i) {
        const DelimitedRow& row = result.events[i];
        if (row.size() < layout.minimumEventFields) {
            throw FatalInputError("Participant row " + std::to_string(i + 1) + " has " +
                                  std::to_string(row.size()) + " field(s), expected at least " +
                                  std::to_string(layout.minimumEventFields) + ".");
        }
    }
    return result;
}

RawExport readExportFile(const std::filesystem::path& path, const ExportLayout& layout) {
    return parseExport(decodeExportText(readFileBytes(path)), layout);
}

}  // namespace backend
